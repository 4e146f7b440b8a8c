/*
 * Copyright (C) 2024 Emeric Poupon
 *
 * This file is part of Rekit.
 *
 * Rekit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Rekit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Rekit.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "recommendation/Types.hpp"

#include "core/String.hpp"

namespace rekit::recommendation
{
    const char* getColdStartPolicyName(ColdStartPolicy policy)
    {
        switch (policy)
        {
        case ColdStartPolicy::Average:
            return "average";
        case ColdStartPolicy::Popular:
            return "popular";
        case ColdStartPolicy::Fail:
            return "fail";
        }

        return "";
    }

    ColdStartPolicy parseColdStartPolicy(std::string_view str)
    {
        for (ColdStartPolicy policy : { ColdStartPolicy::Average, ColdStartPolicy::Popular, ColdStartPolicy::Fail })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(core::stringUtils::stringTrim(str), getColdStartPolicyName(policy)))
                return policy;
        }

        throw InvalidPolicyException{ str };
    }

    const char* getQueryResolutionName(QueryResolution resolution)
    {
        switch (resolution)
        {
        case QueryResolution::Resolved:
            return "resolved";
        case QueryResolution::ColdUser:
            return "cold user";
        case QueryResolution::ColdItem:
            return "cold item";
        case QueryResolution::ColdBoth:
            return "cold user and item";
        }

        return "";
    }
} // namespace rekit::recommendation
