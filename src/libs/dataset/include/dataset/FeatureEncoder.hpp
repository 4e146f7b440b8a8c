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

#include <span>
#include <string_view>
#include <vector>

#include "dataset/FieldDescriptor.hpp"
#include "dataset/RawTable.hpp"
#include "dataset/Schema.hpp"
#include "dataset/Types.hpp"

namespace rekit::dataset
{
    struct EncodedFeatures
    {
        std::vector<FeatureIndex> sparse;      // one local index per sparse field
        std::vector<FeatureIndex> multiSparse; // multi-sparse fields one after the other, each padded to its max width
        std::vector<double> dense;

        bool operator==(const EncodedFeatures&) const = default;
    };

    // Validated values of a row, not encoded yet. Views refer to the cells of the source table
    struct RawFeatures
    {
        std::vector<std::string_view> sparse;
        std::vector<std::vector<std::string_view>> multiSparse;
        std::vector<double> dense;
    };

    // Position of each field in the columns of a raw table
    struct FeatureColumns
    {
        std::vector<std::size_t> sparse;
        std::vector<std::size_t> multiSparse;
        std::vector<std::size_t> dense;
    };

    class FeatureEncoder
    {
    public:
        explicit FeatureEncoder(const Schema& schema);
        ~FeatureEncoder() = default;
        FeatureEncoder(const FeatureEncoder&) = delete;
        FeatureEncoder& operator=(const FeatureEncoder&) = delete;

        FeatureColumns bindColumns(const RawTable& table) const;
        // throws MalformedInputException
        RawFeatures parse(const RawTable::Row& row, const FeatureColumns& columns, std::size_t rowId) const;

        // Training time: registers the unseen categorical values, and on the first call
        // computes the dense statistics and the multi-sparse widths, which are then frozen
        void fit(std::span<const RawFeatures> samples);
        // Gives global sparse indices to the values registered since the last call, must be
        // called once a fit is complete. Global indices already given never move
        void freeze();

        // Deterministic, unknown categorical values are mapped to unknownFeatureIndex
        EncodedFeatures encode(const RawFeatures& features) const;

        const std::vector<FieldDescriptor>& getSparseFields() const { return _sparseFields; }
        const std::vector<FieldDescriptor>& getMultiSparseFields() const { return _multiSparseFields; }
        const std::vector<FieldDescriptor>& getDenseFields() const { return _denseFields; }
        const FieldDescriptor* findField(std::string_view name) const;

        std::size_t getMultiSparseWidth() const; // sum of all the multi-sparse field widths
        std::size_t getSparseFeatureCount() const { return _sparseFeatureCount; }
        std::size_t getGlobalIndex(const FieldDescriptor& field, FeatureIndex localIndex) const { return field.getGlobalIndex(localIndex); }
        std::vector<std::size_t> getGlobalSparseIndices(const EncodedFeatures& features) const;

        // Copies into target the fields of source that have the given association
        void assignAssociatedFeatures(EncodedFeatures& target, const EncodedFeatures& source, FieldAssociation association) const;

    private:
        std::vector<FieldDescriptor> _sparseFields;
        std::vector<FieldDescriptor> _multiSparseFields;
        std::vector<FieldDescriptor> _denseFields;
        char _multiValueSeparator;
        std::size_t _sparseFeatureCount{};
    };
} // namespace rekit::dataset
