#include "mesh_data.h"

void MeshData::clear() {
    vertices.clear();
    uvs.clear();
    opaqueIndices.clear();
    transparentIndices.clear();
}

size_t MeshData::quadCount(Direction direction) const {
    size_t count = 0;
    // Every quad's four vertices carry the same direction
    for (size_t i = 0; i < vertices.size(); i += 4) {
        if (PackedVertex::direction(vertices[i]) == direction) {
            ++count;
        }
    }
    return count;
}
