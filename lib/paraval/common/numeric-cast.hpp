#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <typeinfo>
#include <utility>
#include "error.hpp"
#include "format.hpp"

namespace paraval {
    template<typename TO, typename FROM>
    constexpr TO numeric_cast(const FROM from)
    {
        if (!std::in_range<TO>(from)) [[unlikely]]
            throw error(fmt::format("can't convert {} {} to {}: the value is out of the target range",
                typeid(FROM).name(), from, typeid(TO).name()));
        return static_cast<TO>(from);
    }
}
