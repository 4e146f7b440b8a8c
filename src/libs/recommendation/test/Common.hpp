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

#include <sstream>
#include <string_view>
#include <vector>

#include "dataset/RawTable.hpp"
#include "recommendation/IScoreModel.hpp"

namespace rekit::recommendation::tests
{
    inline dataset::RawTable parseTable(std::string_view content)
    {
        std::istringstream iss{ std::string{ content } };
        return dataset::readTable(iss, dataset::ReadParameters{});
    }

    // Same score for every pair
    class ConstantScoreModel : public IScoreModel
    {
    public:
        ConstantScoreModel(double score, std::size_t itemCount)
            : _score{ score }
            , _itemCount{ itemCount } {}

    private:
        std::string_view getName() const override { return "constant"; }
        void fit(const dataset::RecordSet&) override {}
        double predict(dataset::Index, dataset::Index) const override { return _score; }
        std::vector<double> scoreAllItems(dataset::Index) const override { return std::vector<double>(_itemCount, _score); }
        std::vector<double> scoreAllItemsForUnknownUser() const override { return std::vector<double>(_itemCount, _score); }

        const double _score;
        const std::size_t _itemCount;
    };
} // namespace rekit::recommendation::tests
