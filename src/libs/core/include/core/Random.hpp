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

#pragma once

#include <algorithm>
#include <cstdint>
#include <random>

namespace rekit::core::random
{
    using RandGenerator = std::mt19937;

    RandGenerator createSeededGenerator(std::uint_fast32_t seed);

    template<typename T>
    T getRandom(RandGenerator& generator, T min, T max)
    {
        std::uniform_int_distribution<T> dist{ min, max };
        return dist(generator);
    }

    template<typename T>
    T getRealRandom(RandGenerator& generator, T min, T max)
    {
        std::uniform_real_distribution<T> dist{ min, max };
        return dist(generator);
    }

    template<typename Container>
    void shuffleContainer(Container& container, RandGenerator& generator)
    {
        std::shuffle(std::begin(container), std::end(container), generator);
    }
} // namespace rekit::core::random
