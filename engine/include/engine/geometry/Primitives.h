#pragma once

#include "engine/geometry/MeshBuffers.h"

namespace Vireo::Engine::Primitives {

    // Axis-aligned box centred on the origin, outward-facing counter-clockwise winding.
    MeshBuffers CreateBox(float dx, float dy, float dz);

    // Quad in the XY plane centred on the origin, facing +Z.
    MeshBuffers CreateQuad(float width, float height);

} // namespace Vireo::Engine::Primitives
