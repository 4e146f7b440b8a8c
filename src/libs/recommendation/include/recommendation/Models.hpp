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

#include <memory>

#include "recommendation/IScoreModel.hpp"

namespace rekit::dataset
{
    class DatasetInfo;
}

namespace rekit::recommendation
{
    // Rating: item mean rating. Ranking: item interaction count, normalized by the max one
    std::unique_ptr<IScoreModel> createPopularityModel(const dataset::DatasetInfo& datasetInfo);

    struct UserCFParameters
    {
        std::size_t neighborCount{ 20 };
    };

    // User based collaborative filtering, cosine similarity between the label vectors of the users
    std::unique_ptr<IScoreModel> createUserCFModel(const dataset::DatasetInfo& datasetInfo, const UserCFParameters& params);
} // namespace rekit::recommendation
