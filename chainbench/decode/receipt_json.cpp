// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <chainbench/core/base58.hpp>
#include <chainbench/core/config.hpp>
#include <chainbench/core/likely.h>
#include <chainbench/core/result.hpp>
#include <chainbench/decode/decode_error.hpp>
#include <chainbench/decode/receipt.hpp>
#include <chainbench/decode/receipt_json.hpp>

#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

CHAINBENCH_ANONYMOUS_NAMESPACE_BEGIN

using namespace chainbench;
using json = nlohmann::json;

Result<json const *> field(json const &j, char const *const name)
{
    if (CHAINBENCH_UNLIKELY(!j.is_object())) {
        return DecodeError::WrongType;
    }
    auto const it = j.find(name);
    if (CHAINBENCH_UNLIKELY(it == j.end())) {
        return DecodeError::MissingField;
    }
    return &*it;
}

Result<std::vector<std::string>> string_array(json const &j)
{
    if (CHAINBENCH_UNLIKELY(!j.is_array())) {
        return DecodeError::WrongType;
    }
    std::vector<std::string> out;
    out.reserve(j.size());
    for (auto const &e : j) {
        if (CHAINBENCH_UNLIKELY(!e.is_string())) {
            return DecodeError::WrongType;
        }
        out.push_back(e.get<std::string>());
    }
    return out;
}

Result<ReceiptInstruction>
parse_instruction(json const &j, uint32_t const default_stack_height)
{
    json const *const index = BOOST_OUTCOME_TRYX(field(j, "programIdIndex"));
    json const *const data = BOOST_OUTCOME_TRYX(field(j, "data"));
    if (CHAINBENCH_UNLIKELY(
            !index->is_number_unsigned() || !data->is_string())) {
        return DecodeError::WrongType;
    }
    auto decoded = base58_decode(data->get<std::string>());
    if (CHAINBENCH_UNLIKELY(!decoded.has_value())) {
        return DecodeError::InvalidBase58;
    }

    ReceiptInstruction ix;
    ix.program_id_index = index->get<uint32_t>();
    ix.data = std::move(*decoded);
    ix.stack_height = default_stack_height;
    if (auto const it = j.find("stackHeight");
        it != j.end() && it->is_number_unsigned()) {
        ix.stack_height = it->get<uint32_t>();
    }
    return ix;
}

CHAINBENCH_ANONYMOUS_NAMESPACE_END

CHAINBENCH_NAMESPACE_BEGIN

Result<TransactionReceipt> parse_receipt(json const &j)
{
    json const *const meta = BOOST_OUTCOME_TRYX(field(j, "meta"));
    json const *const tx = BOOST_OUTCOME_TRYX(field(j, "transaction"));
    json const *const message = BOOST_OUTCOME_TRYX(field(*tx, "message"));

    TransactionReceipt receipt;

    if (auto const it = meta->find("err"); it != meta->end() && !it->is_null()) {
        receipt.success = false;
        receipt.error = it->dump();
    }
    else {
        receipt.success = true;
    }

    if (auto const it = meta->find("logMessages");
        it != meta->end() && !it->is_null()) {
        receipt.logs = BOOST_OUTCOME_TRYX(string_array(*it));
    }

    if (auto const it = tx->find("signatures");
        it != tx->end() && it->is_array() && !it->empty() &&
        it->front().is_string()) {
        receipt.signature = it->front().get<std::string>();
    }

    json const *const keys = BOOST_OUTCOME_TRYX(field(*message, "accountKeys"));
    receipt.account_keys = BOOST_OUTCOME_TRYX(string_array(*keys));
    if (auto const it = meta->find("loadedAddresses");
        it != meta->end() && it->is_object()) {
        for (char const *const kind : {"writable", "readonly"}) {
            if (auto const list = it->find(kind); list != it->end()) {
                auto const loaded = BOOST_OUTCOME_TRYX(string_array(*list));
                receipt.account_keys.insert(
                    receipt.account_keys.end(), loaded.begin(), loaded.end());
            }
        }
    }

    json const *const outer =
        BOOST_OUTCOME_TRYX(field(*message, "instructions"));
    if (CHAINBENCH_UNLIKELY(!outer->is_array())) {
        return DecodeError::WrongType;
    }

    std::map<uint64_t, json const *> inner_by_index;
    if (auto const it = meta->find("innerInstructions");
        it != meta->end() && !it->is_null()) {
        if (CHAINBENCH_UNLIKELY(!it->is_array())) {
            return DecodeError::WrongType;
        }
        for (auto const &group : *it) {
            json const *const index = BOOST_OUTCOME_TRYX(field(group, "index"));
            json const *const list =
                BOOST_OUTCOME_TRYX(field(group, "instructions"));
            if (CHAINBENCH_UNLIKELY(
                    !index->is_number_unsigned() || !list->is_array())) {
                return DecodeError::WrongType;
            }
            if (CHAINBENCH_UNLIKELY(index->get<uint64_t>() >= outer->size())) {
                return DecodeError::InnerIndexOutOfRange;
            }
            inner_by_index[index->get<uint64_t>()] = list;
        }
    }

    for (uint64_t i = 0; i < outer->size(); ++i) {
        auto ix = BOOST_OUTCOME_TRYX(parse_instruction((*outer)[i], 1));
        receipt.instructions.push_back(std::move(ix));
        if (auto const it = inner_by_index.find(i); it != inner_by_index.end()) {
            for (auto const &inner_json : *it->second) {
                auto inner = BOOST_OUTCOME_TRYX(parse_instruction(inner_json, 2));
                receipt.instructions.push_back(std::move(inner));
            }
        }
    }
    return receipt;
}

CHAINBENCH_NAMESPACE_END
