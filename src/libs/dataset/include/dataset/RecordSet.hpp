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
#include <span>
#include <unordered_map>
#include <vector>

#include "dataset/FeatureEncoder.hpp"
#include "dataset/Types.hpp"

namespace rekit::dataset
{
    enum class NegativeKind
    {
        None,     // observed interaction
        Sampled,  // synthesized negative
        Fallback, // synthesized negative accepted after the retry bound, may collide with a positive
    };

    // Column oriented storage of the records, row-aligned
    struct RecordColumns
    {
        std::vector<Index> userIndices; // invalidIndex if unresolved
        std::vector<Index> itemIndices; // invalidIndex if unresolved
        std::vector<double> labels;
        std::vector<NegativeKind> negativeKinds;

        std::size_t sparseFieldCount{};
        std::size_t multiSparseWidth{};
        std::size_t denseFieldCount{};
        std::vector<FeatureIndex> sparseIndices; // row-major
        std::vector<FeatureIndex> multiSparseIndices; // row-major
        std::vector<double> denseValues; // row-major

        // raw ids of the users and items unknown at build time, by row
        std::unordered_map<std::size_t, RawId> unresolvedUsers;
        std::unordered_map<std::size_t, RawId> unresolvedItems;

        void append(Index user, Index item, double label, NegativeKind negativeKind, const EncodedFeatures& features);
        std::size_t size() const { return labels.size(); }
    };

    struct RecordView
    {
        Index user;
        Index item;
        double label;
        NegativeKind negativeKind;
        std::span<const FeatureIndex> sparseIndices;
        std::span<const FeatureIndex> multiSparseIndices;
        std::span<const double> denseValues;
    };

    // Immutable ordered set of interaction records
    class RecordSet
    {
    public:
        RecordSet() = default;
        explicit RecordSet(RecordColumns&& columns);

        std::size_t size() const { return _columns.size(); }
        bool empty() const { return size() == 0; }

        std::span<const Index> getUserIndices() const { return _columns.userIndices; }
        std::span<const Index> getItemIndices() const { return _columns.itemIndices; }
        std::span<const double> getLabels() const { return _columns.labels; }
        std::span<const NegativeKind> getNegativeKinds() const { return _columns.negativeKinds; }

        std::size_t getSparseFieldCount() const { return _columns.sparseFieldCount; }
        std::size_t getMultiSparseWidth() const { return _columns.multiSparseWidth; }
        std::size_t getDenseFieldCount() const { return _columns.denseFieldCount; }

        // row-major tensors, size() x field count
        std::span<const FeatureIndex> getSparseIndices() const { return _columns.sparseIndices; }
        std::span<const FeatureIndex> getMultiSparseIndices() const { return _columns.multiSparseIndices; }
        std::span<const double> getDenseValues() const { return _columns.denseValues; }

        RecordView getRecord(std::size_t row) const;
        EncodedFeatures getFeatures(std::size_t row) const;

        bool isResolved(std::size_t row) const { return isUserResolved(row) && isItemResolved(row); }
        bool isUserResolved(std::size_t row) const { return _columns.userIndices[row] != invalidIndex; }
        bool isItemResolved(std::size_t row) const { return _columns.itemIndices[row] != invalidIndex; }
        std::optional<RawId> getUnresolvedUser(std::size_t row) const;
        std::optional<RawId> getUnresolvedItem(std::size_t row) const;
        std::size_t getUnresolvedCount() const;

    private:
        RecordColumns _columns;
    };
} // namespace rekit::dataset
