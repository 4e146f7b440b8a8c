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

#include "core/Exception.hpp"

namespace rekit::core
{
    // Process wide instance of an interface, registered for the lifetime of the Service object.
    // Holds the config and the logger of the tools, the libraries only reach the logger through REKIT_LOG
    template<typename Class>
    class Service
    {
    public:
        explicit Service(std::unique_ptr<Class> service)
        {
            if (!service)
                throw RekitException{ "Cannot register a null service" };
            if (_service)
                throw RekitException{ "Service already registered" };

            _service = std::move(service);
        }

        ~Service()
        {
            _service.reset();
        }

        Service(const Service&) = delete;
        Service& operator=(const Service&) = delete;

        Class* operator->() const { return get(); }
        Class& operator*() const { return *get(); }

        // nullptr if no service is registered
        static Class* get() { return _service.get(); }
        static bool exists() { return static_cast<bool>(_service); }

    private:
        static inline std::unique_ptr<Class> _service;
    };
} // namespace rekit::core
