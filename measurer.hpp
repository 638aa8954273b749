/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <units.hpp>

struct ComponentData;

// The measuring pass of layout. Implementations lay out the (already
// resolved) content of a component in its declared width and report how
// tall it turned out to be.
class HeightMeasurer {
public:
    virtual ~HeightMeasurer() = default;

    virtual Length content_height(const ComponentData &component) = 0;
};
