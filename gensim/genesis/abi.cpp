// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "abi.hpp"

#include <algorithm>
#include <charconv>

#include <gensim/core/common/base.hpp>
#include <gensim/core/common/util.hpp>

namespace gensim::genesis {

namespace {

    constexpr std::string_view kArraySuffix{"[]"};

    std::string canonical_type(std::string_view type) {
        size_t base_end{type.find('[')};
        if (base_end == std::string_view::npos) {
            base_end = type.size();
        }
        std::string base{type.substr(0, base_end)};
        if (base == "uint" || base == "int") {
            base += "256";
        }
        return base + std::string{type.substr(base_end)};
    }

    bool is_array(std::string_view type) { return type.ends_with(kArraySuffix); }

    bool is_dynamic(std::string_view type) { return type == "bytes" || type == "string" || is_array(type); }

    //! Bit width of a uintN type or std::nullopt if type is something else
    std::optional<unsigned> uint_width(std::string_view type) {
        if (!type.starts_with("uint")) {
            return std::nullopt;
        }
        type.remove_prefix(4);
        unsigned bits{0};
        const auto [ptr, ec]{std::from_chars(type.data(), type.data() + type.size(), bits)};
        if (ec != std::errc{} || ptr != type.data() + type.size() || bits == 0 || bits > 256 || bits % 8 != 0) {
            return std::nullopt;
        }
        return bits;
    }

    evmc::bytes32 word(const intx::uint256& value) { return intx::be::store<evmc::bytes32>(value); }

    void append_word(Bytes& out, const evmc::bytes32& w) { out.append(w.bytes, kWordLength); }

    void append_padded(Bytes& out, ByteView data) {
        append_word(out, word(data.size()));
        out.append(data);
        out.append(num_words(data.size()) * kWordLength - data.size(), 0);
    }

    template <typename T>
    const T& expect(const AbiValue& value, std::string_view type) {
        const T* held{std::get_if<T>(&value.value())};
        if (!held) {
            throw AbiError{"value does not match ABI type " + std::string{type}};
        }
        return *held;
    }

    Bytes encode_tuple(const std::vector<std::string_view>& types, const AbiValue::Array& values);

    Bytes encode_single(std::string_view type, const AbiValue& value) {
        Bytes out;
        if (is_array(type)) {
            const auto& items{expect<AbiValue::Array>(value, type)};
            const std::string_view element{type.substr(0, type.size() - kArraySuffix.size())};
            append_word(out, word(items.size()));
            out += encode_tuple(std::vector<std::string_view>(items.size(), element), items);
        } else if (type == "address") {
            evmc::bytes32 w{};
            std::ranges::copy(expect<evmc::address>(value, type).bytes, w.bytes + kWordLength - kAddressLength);
            append_word(out, w);
        } else if (type == "bool") {
            append_word(out, word(expect<bool>(value, type) ? 1 : 0));
        } else if (type == "bytes32") {
            append_word(out, expect<evmc::bytes32>(value, type));
        } else if (type == "bytes") {
            append_padded(out, expect<Bytes>(value, type));
        } else if (type == "string") {
            const auto& text{expect<std::string>(value, type)};
            append_padded(out, ByteView{reinterpret_cast<const uint8_t*>(text.data()), text.size()});
        } else if (const auto bits{uint_width(type)}; bits) {
            const auto& number{expect<intx::uint256>(value, type)};
            if (*bits < 256 && (number >> *bits) != 0) {
                throw AbiError{"value " + intx::to_string(number) + " out of range for " + std::string{type}};
            }
            append_word(out, word(number));
        } else {
            throw AbiError{"unsupported ABI type " + std::string{type}};
        }
        return out;
    }

    Bytes encode_tuple(const std::vector<std::string_view>& types, const AbiValue::Array& values) {
        Bytes head;
        Bytes tail;
        const size_t head_size{types.size() * kWordLength};
        for (size_t i{0}; i < types.size(); ++i) {
            Bytes encoded{encode_single(types[i], values[i])};
            if (is_dynamic(types[i])) {
                append_word(head, word(head_size + tail.size()));
                tail += encoded;
            } else {
                head += encoded;
            }
        }
        return head + tail;
    }

    std::optional<AbiFunction> function_from_json(const nlohmann::json& json) {
        AbiFunction function;
        if (json.contains("name")) {
            if (!json["name"].is_string()) return std::nullopt;
            function.name = json["name"].get<std::string>();
        }
        if (!json.contains("inputs")) {
            return function;
        }
        if (!json["inputs"].is_array()) return std::nullopt;
        for (const auto& input : json["inputs"]) {
            if (!input.is_object() || !input.contains("type") || !input["type"].is_string()) {
                return std::nullopt;
            }
            AbiParam param;
            param.type = canonical_type(input["type"].get<std::string>());
            if (input.contains("name") && input["name"].is_string()) {
                param.name = input["name"].get<std::string>();
            }
            function.inputs.push_back(std::move(param));
        }
        return function;
    }

}  // namespace

std::string AbiFunction::signature() const {
    std::string sig{name + "("};
    for (size_t i{0}; i < inputs.size(); ++i) {
        if (i != 0) sig += ',';
        sig += inputs[i].type;
    }
    return sig + ")";
}

std::array<uint8_t, 4> AbiFunction::selector() const {
    const std::string sig{signature()};
    const auto hash{keccak256(ByteView{reinterpret_cast<const uint8_t*>(sig.data()), sig.size()})};
    return {hash.bytes[0], hash.bytes[1], hash.bytes[2], hash.bytes[3]};
}

const AbiFunction* ContractAbi::find_function(std::string_view name) const noexcept {
    const auto it{std::ranges::find_if(functions, [&](const AbiFunction& f) { return f.name == name; })};
    return it != functions.end() ? &*it : nullptr;
}

std::optional<ContractAbi> ContractAbi::from_json(const nlohmann::json& json) noexcept {
    if (!json.is_array()) {
        return std::nullopt;
    }
    try {
        ContractAbi abi;
        for (const auto& entry : json) {
            if (!entry.is_object() || !entry.contains("type") || !entry["type"].is_string()) {
                return std::nullopt;
            }
            // events, errors, fallback and receive entries are not needed to deploy
            const auto type{entry["type"].get<std::string>()};
            if (type != "constructor" && type != "function") {
                continue;
            }
            auto function{function_from_json(entry)};
            if (!function) {
                return std::nullopt;
            }
            if (type == "constructor") {
                abi.constructor = std::move(*function);
            } else {
                if (function->name.empty()) return std::nullopt;
                abi.functions.push_back(std::move(*function));
            }
        }
        return abi;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

Bytes encode_arguments(const std::vector<AbiParam>& params, const std::vector<AbiValue>& values) {
    if (params.size() != values.size()) {
        throw AbiError{"expected " + std::to_string(params.size()) + " arguments, got " +
                       std::to_string(values.size())};
    }
    std::vector<std::string_view> types;
    types.reserve(params.size());
    for (const auto& param : params) {
        types.emplace_back(param.type);
    }
    return encode_tuple(types, values);
}

Bytes encode_function_call(const ContractAbi& abi, std::string_view name, const std::vector<AbiValue>& values) {
    const AbiFunction* function{abi.find_function(name)};
    if (!function) {
        throw AbiError{"function " + std::string{name} + " not found in ABI"};
    }
    const auto selector{function->selector()};
    Bytes out{selector.data(), selector.size()};
    out += encode_arguments(function->inputs, values);
    return out;
}

Bytes encode_constructor(const ContractAbi& abi, const std::vector<AbiValue>& values) {
    if (!abi.constructor) {
        if (!values.empty()) {
            throw AbiError{"ABI has no constructor but arguments were given"};
        }
        return {};
    }
    return encode_arguments(abi.constructor->inputs, values);
}

}  // namespace gensim::genesis
