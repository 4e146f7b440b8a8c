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

#include "dataset/FeatureEncoder.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "dataset/Exception.hpp"

namespace rekit::dataset
{
    namespace
    {
        const std::string& getCell(const RawTable::Row& row, std::size_t column, std::string_view columnName, std::size_t rowId)
        {
            if (column >= row.size() || row[column].empty())
                throw MalformedInputException{ rowId, columnName, "missing value" };

            return row[column];
        }

        // sample variance, 0 if less than two samples
        double computeStdDev(const std::vector<double>& values, double mean)
        {
            const std::size_t size{ values.size() };
            if (size < 2)
                return 0;

            const double variance{ std::accumulate(std::cbegin(values), std::cend(values), 0.,
                [mean, size](double accumulator, double val) {
                    return accumulator + ((val - mean) * (val - mean) / (size - 1));
                }) };

            return std::sqrt(variance);
        }

        std::vector<FeatureIndex> encodeMultiValues(const SparseMultiField& field, std::span<const std::string_view> values)
        {
            std::vector<FeatureIndex> res;
            res.reserve(values.size());
            for (std::string_view value : values)
            {
                const FeatureIndex index{ field.vocabulary.findIndex(value) };
                if (index != unknownFeatureIndex)
                    res.push_back(index);
            }

            // order insensitive
            std::sort(std::begin(res), std::end(res));
            res.erase(std::unique(std::begin(res), std::end(res)), std::end(res));

            res.resize(field.maxWidth, unknownFeatureIndex);
            return res;
        }
    } // namespace

    FeatureEncoder::FeatureEncoder(const Schema& schema)
        : _multiValueSeparator{ schema.multiValueSeparator }
    {
        schema.validate();

        for (const std::string& column : schema.sparseColumns)
            _sparseFields.emplace_back(column, FieldKind::SparseSingle, schema.getAssociation(column));

        for (const std::string& column : schema.multiSparseColumns)
        {
            FieldDescriptor& field{ _multiSparseFields.emplace_back(column, FieldKind::SparseMulti, schema.getAssociation(column)) };

            const auto itMaxWidth{ schema.multiSparseMaxWidths.find(column) };
            if (itMaxWidth != std::cend(schema.multiSparseMaxWidths))
            {
                field.get<SparseMultiField>().maxWidth = itMaxWidth->second;
                field.get<SparseMultiField>().maxWidthFrozen = true;
            }
        }

        for (const std::string& column : schema.denseColumns)
        {
            FieldDescriptor& field{ _denseFields.emplace_back(column, FieldKind::Dense, schema.getAssociation(column)) };
            field.get<DenseField>().standardize = schema.standardizeDense;
        }
    }

    FeatureColumns FeatureEncoder::bindColumns(const RawTable& table) const
    {
        FeatureColumns columns;

        for (const FieldDescriptor& field : _sparseFields)
            columns.sparse.push_back(table.getColumnIndex(field.getName()));
        for (const FieldDescriptor& field : _multiSparseFields)
            columns.multiSparse.push_back(table.getColumnIndex(field.getName()));
        for (const FieldDescriptor& field : _denseFields)
            columns.dense.push_back(table.getColumnIndex(field.getName()));

        return columns;
    }

    RawFeatures FeatureEncoder::parse(const RawTable::Row& row, const FeatureColumns& columns, std::size_t rowId) const
    {
        RawFeatures features;

        features.sparse.reserve(_sparseFields.size());
        for (std::size_t i{}; i < _sparseFields.size(); ++i)
            features.sparse.emplace_back(getCell(row, columns.sparse[i], _sparseFields[i].getName(), rowId));

        features.multiSparse.reserve(_multiSparseFields.size());
        for (std::size_t i{}; i < _multiSparseFields.size(); ++i)
        {
            const std::string& cell{ getCell(row, columns.multiSparse[i], _multiSparseFields[i].getName(), rowId) };

            std::vector<std::string_view>& values{ features.multiSparse.emplace_back() };
            for (std::string_view value : core::stringUtils::splitString(cell, _multiValueSeparator))
            {
                value = core::stringUtils::stringTrim(value);
                if (!value.empty())
                    values.push_back(value);
            }

            if (values.empty())
                throw MalformedInputException{ rowId, _multiSparseFields[i].getName(), "no value in multi-valued cell" };
        }

        features.dense.reserve(_denseFields.size());
        for (std::size_t i{}; i < _denseFields.size(); ++i)
        {
            const std::string& cell{ getCell(row, columns.dense[i], _denseFields[i].getName(), rowId) };

            const std::optional<double> value{ core::stringUtils::readAs<double>(cell) };
            if (!value || !std::isfinite(*value))
                throw MalformedInputException{ rowId, _denseFields[i].getName(), "'" + cell + "' is not a finite number" };

            features.dense.push_back(*value);
        }

        return features;
    }

    void FeatureEncoder::fit(std::span<const RawFeatures> samples)
    {
        for (std::size_t i{}; i < _sparseFields.size(); ++i)
        {
            Vocabulary& vocabulary{ _sparseFields[i].getVocabulary() };
            const std::size_t prevCardinality{ vocabulary.getCardinality() };

            for (const RawFeatures& sample : samples)
                vocabulary.getOrCreateIndex(sample.sparse[i]);

            REKIT_LOG_IF(ENCODER, DEBUG, vocabulary.getCardinality() != prevCardinality, "Field '" << _sparseFields[i].getName() << "': cardinality " << prevCardinality << " -> " << vocabulary.getCardinality());
        }

        for (std::size_t i{}; i < _multiSparseFields.size(); ++i)
        {
            SparseMultiField& field{ _multiSparseFields[i].get<SparseMultiField>() };

            std::size_t maxObservedWidth{};
            for (const RawFeatures& sample : samples)
            {
                for (std::string_view value : sample.multiSparse[i])
                    field.vocabulary.getOrCreateIndex(value);

                maxObservedWidth = std::max(maxObservedWidth, sample.multiSparse[i].size());
            }

            if (!field.maxWidthFrozen && !samples.empty())
            {
                field.maxWidth = maxObservedWidth;
                field.maxWidthFrozen = true;
                REKIT_LOG(ENCODER, DEBUG, "Field '" << _multiSparseFields[i].getName() << "': max width set to " << field.maxWidth);
            }
        }

        for (std::size_t i{}; i < _denseFields.size(); ++i)
        {
            DenseField& field{ _denseFields[i].get<DenseField>() };
            if (field.statsFrozen || samples.empty())
                continue;

            if (field.standardize)
            {
                std::vector<double> values;
                values.reserve(samples.size());
                for (const RawFeatures& sample : samples)
                    values.push_back(sample.dense[i]);

                field.mean = std::accumulate(std::cbegin(values), std::cend(values), 0.) / values.size();
                field.stdDev = computeStdDev(values, field.mean);
                if (field.stdDev == 0)
                    field.stdDev = 1;

                REKIT_LOG(ENCODER, DEBUG, "Field '" << _denseFields[i].getName() << "': mean = " << field.mean << ", stddev = " << field.stdDev);
            }
            field.statsFrozen = true;
        }
    }

    void FeatureEncoder::freeze()
    {
        for (std::vector<FieldDescriptor>* fields : { &_sparseFields, &_multiSparseFields })
        {
            for (FieldDescriptor& field : *fields)
            {
                const std::size_t span{ field.getUnassignedSpan() };
                if (span == 0)
                    continue;

                field.assignIndexRange(_sparseFeatureCount);
                _sparseFeatureCount += span;
            }
        }
    }

    EncodedFeatures FeatureEncoder::encode(const RawFeatures& features) const
    {
        EncodedFeatures res;

        res.sparse.reserve(_sparseFields.size());
        for (std::size_t i{}; i < _sparseFields.size(); ++i)
            res.sparse.push_back(_sparseFields[i].getVocabulary().findIndex(features.sparse[i]));

        res.multiSparse.reserve(getMultiSparseWidth());
        for (std::size_t i{}; i < _multiSparseFields.size(); ++i)
        {
            const std::vector<FeatureIndex> indices{ encodeMultiValues(_multiSparseFields[i].get<SparseMultiField>(), features.multiSparse[i]) };
            res.multiSparse.insert(std::end(res.multiSparse), std::cbegin(indices), std::cend(indices));
        }

        res.dense.reserve(_denseFields.size());
        for (std::size_t i{}; i < _denseFields.size(); ++i)
        {
            const DenseField& field{ _denseFields[i].get<DenseField>() };
            res.dense.push_back(field.standardize ? (features.dense[i] - field.mean) / field.stdDev : features.dense[i]);
        }

        return res;
    }

    const FieldDescriptor* FeatureEncoder::findField(std::string_view name) const
    {
        for (const std::vector<FieldDescriptor>* fields : { &_sparseFields, &_multiSparseFields, &_denseFields })
        {
            auto it{ std::find_if(std::cbegin(*fields), std::cend(*fields), [&](const FieldDescriptor& field) { return field.getName() == name; }) };
            if (it != std::cend(*fields))
                return &(*it);
        }

        return nullptr;
    }

    std::size_t FeatureEncoder::getMultiSparseWidth() const
    {
        return std::accumulate(std::cbegin(_multiSparseFields), std::cend(_multiSparseFields), std::size_t{ 0 },
            [](std::size_t sum, const FieldDescriptor& field) { return sum + field.get<SparseMultiField>().maxWidth; });
    }

    std::vector<std::size_t> FeatureEncoder::getGlobalSparseIndices(const EncodedFeatures& features) const
    {
        std::vector<std::size_t> res;
        res.reserve(features.sparse.size() + features.multiSparse.size());

        for (std::size_t i{}; i < _sparseFields.size(); ++i)
            res.push_back(getGlobalIndex(_sparseFields[i], features.sparse[i]));

        std::size_t pos{};
        for (const FieldDescriptor& field : _multiSparseFields)
        {
            for (std::size_t slot{}; slot < field.get<SparseMultiField>().maxWidth; ++slot)
                res.push_back(getGlobalIndex(field, features.multiSparse[pos++]));
        }

        return res;
    }

    void FeatureEncoder::assignAssociatedFeatures(EncodedFeatures& target, const EncodedFeatures& source, FieldAssociation association) const
    {
        for (std::size_t i{}; i < _sparseFields.size(); ++i)
        {
            if (_sparseFields[i].getAssociation() == association)
                target.sparse[i] = source.sparse[i];
        }

        std::size_t pos{};
        for (const FieldDescriptor& field : _multiSparseFields)
        {
            const std::size_t width{ field.get<SparseMultiField>().maxWidth };
            if (field.getAssociation() == association)
                std::copy_n(std::next(std::cbegin(source.multiSparse), pos), width, std::next(std::begin(target.multiSparse), pos));

            pos += width;
        }

        for (std::size_t i{}; i < _denseFields.size(); ++i)
        {
            if (_denseFields[i].getAssociation() == association)
                target.dense[i] = source.dense[i];
        }
    }
} // namespace rekit::dataset
