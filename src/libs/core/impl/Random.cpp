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

#include "core/Random.hpp"

namespace rekit::core::random
{
    RandGenerator createSeededGenerator(std::uint_fast32_t seed)
    {
        return RandGenerator{ seed };
    }
} // namespace rekit::core::random
