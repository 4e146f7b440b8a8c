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

#include "dataset/FieldDescriptor.hpp"

#include <algorithm>
#include <type_traits>

#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    namespace
    {
        FieldDescriptor::Details createDetails(FieldKind kind)
        {
            switch (kind)
            {
            case FieldKind::SparseSingle:
                return SparseSingleField{};
            case FieldKind::SparseMulti:
                return SparseMultiField{};
            case FieldKind::Dense:
                return DenseField{};
            }

            throw Exception{ "Unhandled field kind" };
        }
    } // namespace

    const char* getFieldKindName(FieldKind kind)
    {
        switch (kind)
        {
        case FieldKind::SparseSingle:
            return "sparse";
        case FieldKind::SparseMulti:
            return "multi-sparse";
        case FieldKind::Dense:
            return "dense";
        }
        return "";
    }

    FeatureIndex Vocabulary::getOrCreateIndex(std::string_view value)
    {
        auto [it, inserted]{ _indices.try_emplace(std::string{ value }, static_cast<FeatureIndex>(_values.size() + 1)) };
        if (inserted)
            _values.emplace_back(value);

        return it->second;
    }

    FeatureIndex Vocabulary::findIndex(std::string_view value) const
    {
        const auto it{ _indices.find(std::string{ value }) };
        if (it == std::cend(_indices))
            return unknownFeatureIndex;

        return it->second;
    }

    const std::string& Vocabulary::getValue(FeatureIndex index) const
    {
        if (index == unknownFeatureIndex || index > _values.size())
            throw Exception{ "Feature index " + std::to_string(index) + " does not match any known value" };

        return _values[index - 1];
    }

    FieldDescriptor::FieldDescriptor(std::string name, FieldKind kind, FieldAssociation association)
        : _name{ std::move(name) }
        , _association{ association }
        , _details{ createDetails(kind) }
    {
    }

    FieldKind FieldDescriptor::getKind() const
    {
        return std::visit([](const auto& details) {
            using T = std::decay_t<decltype(details)>;
            if constexpr (std::is_same_v<T, SparseSingleField>)
                return FieldKind::SparseSingle;
            else if constexpr (std::is_same_v<T, SparseMultiField>)
                return FieldKind::SparseMulti;
            else
                return FieldKind::Dense;
        },
            _details);
    }

    const Vocabulary& FieldDescriptor::getVocabulary() const
    {
        if (const auto* single{ std::get_if<SparseSingleField>(&_details) })
            return single->vocabulary;
        if (const auto* multi{ std::get_if<SparseMultiField>(&_details) })
            return multi->vocabulary;

        throw Exception{ "Field '" + _name + "' is not a sparse field" };
    }

    Vocabulary& FieldDescriptor::getVocabulary()
    {
        return const_cast<Vocabulary&>(static_cast<const FieldDescriptor&>(*this).getVocabulary());
    }

    std::size_t FieldDescriptor::getOffset() const
    {
        if (_indexRanges.empty())
            throw Exception{ "Field '" + _name + "' has no index range assigned" };

        return _indexRanges.front().globalOffset;
    }

    void FieldDescriptor::assignIndexRange(std::size_t globalOffset)
    {
        if (getUnassignedSpan() == 0)
            return;

        _indexRanges.push_back(IndexRange{ static_cast<FeatureIndex>(_assignedSpan), globalOffset });
        _assignedSpan = getSpan();
    }

    std::size_t FieldDescriptor::getGlobalIndex(FeatureIndex localIndex) const
    {
        if (localIndex >= _assignedSpan)
            throw Exception{ "Field '" + _name + "': no global index for local index " + std::to_string(localIndex) };

        // last range starting at or before the local index
        const auto it{ std::upper_bound(std::cbegin(_indexRanges), std::cend(_indexRanges), localIndex,
            [](FeatureIndex index, const IndexRange& range) { return index < range.localBegin; }) };

        const IndexRange& range{ *std::prev(it) };
        return range.globalOffset + (localIndex - range.localBegin);
    }
} // namespace rekit::dataset
