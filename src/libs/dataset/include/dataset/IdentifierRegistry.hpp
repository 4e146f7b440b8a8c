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

#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dataset/Types.hpp"

namespace rekit::dataset
{
    // Append-only bijection between raw identifiers and dense indices, in first-seen order
    class IdMapping
    {
    public:
        Index getOrCreateIndex(std::string_view rawId);
        std::optional<Index> findIndex(std::string_view rawId) const;
        const RawId* findRawId(Index index) const;

        std::size_t size() const { return _rawIds.size(); }
        const std::vector<RawId>& getRawIds() const { return _rawIds; }

    private:
        std::unordered_map<RawId, Index> _indices;
        std::vector<RawId> _rawIds;
    };

    class IdentifierRegistry
    {
    public:
        IdentifierRegistry() = default;
        ~IdentifierRegistry() = default;
        IdentifierRegistry(const IdentifierRegistry&) = delete;
        IdentifierRegistry& operator=(const IdentifierRegistry&) = delete;

        // Training time: assigns the next index if the raw id has never been seen
        Index getOrCreateIndex(EntityType type, std::string_view rawId);

        // Inference time, no mutation: throw UnknownEntityException
        Index lookupIndex(EntityType type, std::string_view rawId) const;
        const RawId& lookupRaw(EntityType type, Index index) const;

        std::optional<Index> findIndex(EntityType type, std::string_view rawId) const;
        bool contains(EntityType type, std::string_view rawId) const { return findIndex(type, rawId).has_value(); }

        std::size_t getCount(EntityType type) const { return getMapping(type).size(); }

    private:
        IdMapping& getMapping(EntityType type);
        const IdMapping& getMapping(EntityType type) const;

        IdMapping _users;
        IdMapping _items;
    };
} // namespace rekit::dataset
