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

#include "dataset/IdentifierRegistry.hpp"

#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    Index IdMapping::getOrCreateIndex(std::string_view rawId)
    {
        auto [it, inserted]{ _indices.try_emplace(RawId{ rawId }, _rawIds.size()) };
        if (inserted)
            _rawIds.emplace_back(rawId);

        return it->second;
    }

    std::optional<Index> IdMapping::findIndex(std::string_view rawId) const
    {
        const auto it{ _indices.find(RawId{ rawId }) };
        if (it == std::cend(_indices))
            return std::nullopt;

        return it->second;
    }

    const RawId* IdMapping::findRawId(Index index) const
    {
        if (index >= _rawIds.size())
            return nullptr;

        return &_rawIds[index];
    }

    Index IdentifierRegistry::getOrCreateIndex(EntityType type, std::string_view rawId)
    {
        return getMapping(type).getOrCreateIndex(rawId);
    }

    Index IdentifierRegistry::lookupIndex(EntityType type, std::string_view rawId) const
    {
        const std::optional<Index> index{ findIndex(type, rawId) };
        if (!index)
            throw UnknownEntityException{ type, rawId };

        return *index;
    }

    const RawId& IdentifierRegistry::lookupRaw(EntityType type, Index index) const
    {
        const RawId* rawId{ getMapping(type).findRawId(index) };
        if (!rawId)
            throw UnknownEntityException{ type, index };

        return *rawId;
    }

    std::optional<Index> IdentifierRegistry::findIndex(EntityType type, std::string_view rawId) const
    {
        return getMapping(type).findIndex(rawId);
    }

    IdMapping& IdentifierRegistry::getMapping(EntityType type)
    {
        return type == EntityType::User ? _users : _items;
    }

    const IdMapping& IdentifierRegistry::getMapping(EntityType type) const
    {
        return type == EntityType::User ? _users : _items;
    }
} // namespace rekit::dataset
