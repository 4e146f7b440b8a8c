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

#include <string>
#include <string_view>

#include "core/Exception.hpp"
#include "dataset/Types.hpp"

namespace rekit::dataset
{
    class Exception : public core::RekitException
    {
    public:
        using RekitException::RekitException;
    };

    // Missing or non-finite value in a declared column, aborts the whole build
    class MalformedInputException : public Exception
    {
    public:
        MalformedInputException(std::size_t rowId, std::string_view column, std::string_view reason)
            : Exception{ "Malformed input at row " + std::to_string(rowId) + ", column '" + std::string{ column } + "': " + std::string{ reason } }
            , _rowId{ rowId }
            , _column{ column }
        {
        }

        std::size_t getRowId() const { return _rowId; }
        const std::string& getColumn() const { return _column; }

    private:
        std::size_t _rowId;
        std::string _column;
    };

    // Identifier absent from the registry, recoverable through cold start policies
    class UnknownEntityException : public Exception
    {
    public:
        UnknownEntityException(EntityType type, std::string_view rawId)
            : Exception{ std::string{ "Unknown " } + getEntityTypeName(type) + " '" + std::string{ rawId } + "'" }
            , _type{ type }
            , _rawId{ rawId }
        {
        }

        UnknownEntityException(EntityType type, Index index)
            : Exception{ std::string{ "Unknown " } + getEntityTypeName(type) + " index " + std::to_string(index) }
            , _type{ type }
        {
        }

        EntityType getEntityType() const { return _type; }
        const RawId& getRawId() const { return _rawId; }

    private:
        EntityType _type;
        RawId _rawId;
    };
} // namespace rekit::dataset
