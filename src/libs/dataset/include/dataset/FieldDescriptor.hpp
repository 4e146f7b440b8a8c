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
#include <unordered_map>
#include <variant>
#include <vector>

#include "dataset/Schema.hpp"
#include "dataset/Types.hpp"

namespace rekit::dataset
{
    enum class FieldKind
    {
        SparseSingle,
        SparseMulti,
        Dense,
    };
    const char* getFieldKindName(FieldKind kind);

    // Categorical values of a field, local index 0 is reserved for unknown values
    class Vocabulary
    {
    public:
        FeatureIndex getOrCreateIndex(std::string_view value);
        FeatureIndex findIndex(std::string_view value) const; // unknownFeatureIndex if not found

        // Number of known values, the reserved index is not counted
        std::size_t getCardinality() const { return _values.size(); }
        const std::string& getValue(FeatureIndex index) const;

    private:
        std::unordered_map<std::string, FeatureIndex> _indices;
        std::vector<std::string> _values;
    };

    struct SparseSingleField
    {
        Vocabulary vocabulary;
    };

    struct SparseMultiField
    {
        Vocabulary vocabulary;
        std::size_t maxWidth{};
        bool maxWidthFrozen{};
    };

    struct DenseField
    {
        double mean{};
        double stdDev{ 1. };
        bool standardize{};
        bool statsFrozen{};
    };

    class FieldDescriptor
    {
    public:
        using Details = std::variant<SparseSingleField, SparseMultiField, DenseField>;

        FieldDescriptor(std::string name, FieldKind kind, FieldAssociation association);

        const std::string& getName() const { return _name; }
        FieldKind getKind() const;
        FieldAssociation getAssociation() const { return _association; }
        bool isSparse() const { return getKind() != FieldKind::Dense; }

        // sparse fields only
        const Vocabulary& getVocabulary() const;
        Vocabulary& getVocabulary();
        std::size_t getCardinality() const { return getVocabulary().getCardinality(); }
        // Number of local indices (known values + reserved index)
        std::size_t getSpan() const { return getCardinality() + 1; }

        // Global sparse index ranges: the first one is laid out with the other fields, the
        // values registered by later fits get additional ranges at the end of the index space
        struct IndexRange
        {
            FeatureIndex localBegin;
            std::size_t globalOffset;
        };
        const std::vector<IndexRange>& getIndexRanges() const { return _indexRanges; }
        std::size_t getOffset() const; // offset of the first range
        // Local indices without a global index yet
        std::size_t getUnassignedSpan() const { return getSpan() - _assignedSpan; }
        // Assigns the unassigned local indices starting at globalOffset
        void assignIndexRange(std::size_t globalOffset);
        // throws Exception if the local index has no global index yet
        std::size_t getGlobalIndex(FeatureIndex localIndex) const;

        template<typename T>
        const T& get() const { return std::get<T>(_details); }
        template<typename T>
        T& get() { return std::get<T>(_details); }

    private:
        std::string _name;
        FieldAssociation _association;
        std::vector<IndexRange> _indexRanges;
        std::size_t _assignedSpan{};
        Details _details;
    };
} // namespace rekit::dataset
