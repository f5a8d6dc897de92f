#pragma once

#include "di/container/interface/access.h"
#include "di/container/string/string.h"
#include "di/container/string/string_view.h"
#include "di/container/vector/vector.h"
#include "di/util/initializer_list.h"
#include "di/vocab/optional/prelude.h"

namespace vtmux {
// A single numeric escape sequence parameter. Parameters may be omitted
// entirely (as in "CSI ;5H"), which is distinct from an explicit 0.
class Param {
public:
    Param() = default;

    constexpr Param(u32 value) : m_value(value) {}

    constexpr auto value() const -> u32 { return m_value.value(); }
    constexpr auto has_value() const -> bool { return m_value.has_value(); }
    constexpr auto value_or(u32 fallback) const -> u32 { return m_value.value_or(fallback); }

    auto operator==(Param const&) const -> bool = default;

private:
    di::Optional<u32> m_value;
};

// View over the `:` separated pieces of one parameter. This borrows from
// the owning `Params` object.
class Subparams {
public:
    Subparams() = default;

    constexpr auto get(usize index = 0, u32 fallback = 0) const -> u32 {
        return m_subparams.at(index).value_or(Param(fallback)).value_or(fallback);
    }

    constexpr auto empty() const { return m_subparams.empty(); }
    constexpr auto size() const { return m_subparams.size(); }

    auto to_string() const -> di::String;

    auto operator==(Subparams const& other) const -> bool = default;

private:
    friend class Params;

    constexpr explicit Subparams(di::Span<Param const> subparams) : m_subparams(subparams) {}

    di::Span<Param const> m_subparams;
};

// The parameter list of a CSI sequence. Each `;` separated entry may itself
// carry `:` separated subparameters, which is how the colon form of SGR
// extended colors (38:2:r:g:b) is represented.
class Params {
public:
    static auto from_string(di::StringView view) -> Params;

    Params() = default;

    constexpr Params(std::initializer_list<std::initializer_list<Param>> params) {
        for (auto const& subparams : params) {
            m_parameters.emplace_back(subparams);
        }
    }

    constexpr auto clone() const -> Params { return Params(m_parameters.clone()); }

    constexpr auto get(usize index = 0, u32 fallback = 0) const -> u32 {
        return m_parameters.at(index).and_then(di::at(0)).value_or(Param(fallback)).value_or(fallback);
    }

    // Most cursor and editing commands treat both a missing parameter and an explicit
    // 0 as 1. This returns that normalized count.
    constexpr auto count(usize index = 0) const -> u32 {
        auto value = get(index, 1);
        return value == 0 ? 1 : value;
    }

    constexpr auto get_subparam(usize index = 0, usize subindex = 1, u32 fallback = 0) const -> u32 {
        return m_parameters.at(index).and_then(di::at(subindex)).value_or(Param(fallback)).value_or(fallback);
    }

    constexpr auto empty() const { return m_parameters.empty(); }
    constexpr auto size() const { return m_parameters.size(); }

    constexpr auto subparams(usize index = 0) const -> Subparams {
        auto span = m_parameters.at(index)
                        .transform([&](auto const& subparams) {
                            return subparams.span();
                        })
                        .value_or(di::Span<Param const> {});
        return Subparams(span);
    }

    constexpr void add_empty_param() { m_parameters.emplace_back(); }
    constexpr void add_param(u32 value) { m_parameters.push_back({ value }); }

    constexpr void add_subparam(u32 value) {
        if (empty()) {
            add_param(value);
        } else {
            m_parameters.back().value().push_back(value);
        }
    }
    constexpr void add_empty_subparam() {
        if (empty()) {
            add_empty_param();
        }
        m_parameters.back().value().emplace_back();
    }

    auto to_string() const -> di::String;

    auto operator==(Params const& other) const -> bool = default;

private:
    constexpr explicit Params(di::Vector<di::Vector<Param>> params) : m_parameters(di::move(params)) {}

    di::Vector<di::Vector<Param>> m_parameters;
};
}
