/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_EVM_RPC_MOCK_HPP
#define TREASURY_TURBO_EVM_RPC_MOCK_HPP

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <tt/evm/abi.hpp>
#include <tt/http/client-mock.hpp>

namespace treasury_turbo::evm {
    /*
     * Answers eth_call requests routed through http::client_mock.
     * A response registered for the exact call data wins over one registered for the function selector only.
     * Unknown calls are answered with an "execution reverted" JSON-RPC error.
     */
    struct rpc_responder {
        static std::string words(const std::initializer_list<cpp_int> vals)
        {
            uint8_vector data {};
            for (const auto &v: vals)
                data << big_uint_to_word(v);
            return to_hex(data);
        }

        static cpp_int word_of(const address &a)
        {
            return big_uint_from_bytes(a);
        }

        void on_call(const address &to, const abi::encoder &call, std::string result_hex)
        {
            _state->exact.insert_or_assign(_key(to, to_hex(call.data())), std::move(result_hex));
        }

        void on_selector(const address &to, const std::string_view signature, std::string result_hex)
        {
            _state->by_selector.insert_or_assign(_key(to, to_hex(abi::function_selector(signature))), std::move(result_hex));
        }

        void revert(const address &to, const abi::encoder &call)
        {
            _state->exact.erase(_key(to, to_hex(call.data())));
            _state->reverted.insert_or_assign(_key(to, to_hex(call.data())), true);
        }

        void install(http::client_mock &http, const std::string &url) const
        {
            http.add_json(url, [state=_state](const json::object &req) {
                const auto &call = req.at("params").as_array().at(0).as_object();
                const std::string to = normalize_address(call.at("to").as_string());
                const std::string data = normalize_address(call.at("data").as_string());
                json::object resp {
                    { "jsonrpc", "2.0" },
                    { "id", req.at("id") }
                };
                const auto exact_key = _key(to, data);
                if (state->reverted.contains(exact_key)) {
                    resp.emplace("error", json::object { { "code", 3 }, { "message", "execution reverted" } });
                    return json::value { std::move(resp) };
                }
                if (const auto it = state->exact.find(exact_key); it != state->exact.end()) {
                    resp.emplace("result", it->second);
                    return json::value { std::move(resp) };
                }
                if (const auto it = state->by_selector.find(_key(to, data.substr(0, 10))); it != state->by_selector.end()) {
                    resp.emplace("result", it->second);
                    return json::value { std::move(resp) };
                }
                resp.emplace("error", json::object { { "code", 3 }, { "message", "execution reverted" } });
                return json::value { std::move(resp) };
            });
        }
    private:
        struct state_type {
            std::map<std::string, std::string> exact {};
            std::map<std::string, std::string> by_selector {};
            std::map<std::string, bool> reverted {};
        };

        std::shared_ptr<state_type> _state = std::make_shared<state_type>();

        static std::string _key(const address &to, const std::string_view data)
        {
            return _key(to.to_string(), data);
        }

        static std::string _key(const std::string_view to, const std::string_view data)
        {
            return fmt::format("{}:{}", to, data);
        }
    };
}

#endif // !TREASURY_TURBO_EVM_RPC_MOCK_HPP
