#include <gtest/gtest.h>
#include <tiny_gltf.h>
#include "utils/GltfLoader.hpp"
#include <cstring>

namespace {

// Appends one tightly packed accessor, with its own buffer and view, to the model
template <typename T>
int addAccessor(tinygltf::Model& model, const std::vector<T>& values, int componentType, int type,
                int byteStride = 0) {
    tinygltf::Buffer buffer;
    size_t stride = byteStride > 0 ? static_cast<size_t>(byteStride) : sizeof(T);
    buffer.data.assign(values.empty() ? 0 : (values.size() - 1) * stride + sizeof(T), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        std::memcpy(buffer.data.data() + i * stride, &values[i], sizeof(T));
    }
    model.buffers.push_back(buffer);

    tinygltf::BufferView view;
    view.buffer = static_cast<int>(model.buffers.size()) - 1;
    view.byteOffset = 0;
    view.byteLength = model.buffers.back().data.size();
    view.byteStride = byteStride;
    model.bufferViews.push_back(view);

    tinygltf::Accessor accessor;
    accessor.bufferView = static_cast<int>(model.bufferViews.size()) - 1;
    accessor.byteOffset = 0;
    accessor.componentType = componentType;
    accessor.type = type;
    accessor.count = values.size();
    model.accessors.push_back(accessor);
    return static_cast<int>(model.accessors.size()) - 1;
}

int addVec3(tinygltf::Model& model, const std::vector<glm::vec3>& values) {
    return addAccessor(model, values, TINYGLTF_COMPONENT_TYPE_FLOAT, TINYGLTF_TYPE_VEC3);
}

std::map<std::string, int> morphTarget(tinygltf::Model& model, float offset) {
    std::map<std::string, int> target;
    target["POSITION"] = addVec3(model, std::vector<glm::vec3>(3, glm::vec3(offset)));
    target["NORMAL"] = addVec3(model, std::vector<glm::vec3>(3, glm::vec3(0.0f, offset, 0.0f)));
    return target;
}

tinygltf::Model triangleModel() {
    tinygltf::Model model;
    tinygltf::Primitive primitive;
    primitive.mode = TINYGLTF_MODE_TRIANGLES;
    primitive.attributes["POSITION"] = addVec3(model, {
        glm::vec3(0.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)});
    primitive.attributes["NORMAL"] = addVec3(model, std::vector<glm::vec3>(3, glm::vec3(0.0f, 0.0f, 1.0f)));
    primitive.attributes["TEXCOORD_0"] = addAccessor(model, std::vector<glm::vec2>{
        glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(0.0f, 1.0f)},
        TINYGLTF_COMPONENT_TYPE_FLOAT, TINYGLTF_TYPE_VEC2);
    primitive.indices = addAccessor(model, std::vector<uint16_t>{0, 1, 2},
                                    TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT, TINYGLTF_TYPE_SCALAR);

    tinygltf::Mesh mesh;
    mesh.primitives.push_back(primitive);
    model.meshes.push_back(mesh);
    return model;
}

tinygltf::Primitive& primitiveOf(tinygltf::Model& model) {
    return model.meshes[0].primitives[0];
}

}

TEST(GltfLoaderTest, ReadsSingleTrianglePrimitive) {
    MeshData data = GltfLoader::fromModel(triangleModel());

    ASSERT_EQ(data.vertices.size(), 3u);
    EXPECT_EQ(data.vertices[1].position, glm::vec3(1.0f, 0.0f, 0.0f));
    EXPECT_EQ(data.vertices[2].normal, glm::vec3(0.0f, 0.0f, 1.0f));
    EXPECT_EQ(data.vertices[2].texCoord, glm::vec2(0.0f, 1.0f));
    EXPECT_EQ(data.indices, (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(data.indexWidth, IndexWidth::U16);
    EXPECT_FALSE(data.hasMorphTargets());
}

TEST(GltfLoaderTest, KeepsThirtyTwoBitIndices) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).indices = addAccessor(model, std::vector<uint32_t>{2, 1, 0},
                                             TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT, TINYGLTF_TYPE_SCALAR);
    MeshData data = GltfLoader::fromModel(model);
    EXPECT_EQ(data.indexWidth, IndexWidth::U32);
    EXPECT_EQ(data.indices, (std::vector<uint32_t>{2, 1, 0}));
}

TEST(GltfLoaderTest, RequiresExactlyOneMesh) {
    tinygltf::Model empty = triangleModel();
    empty.meshes.clear();
    EXPECT_THROW(GltfLoader::fromModel(empty), std::runtime_error);

    tinygltf::Model twoMeshes = triangleModel();
    twoMeshes.meshes.push_back(twoMeshes.meshes[0]);
    EXPECT_THROW(GltfLoader::fromModel(twoMeshes), std::runtime_error);
}

TEST(GltfLoaderTest, RequiresExactlyOnePrimitive) {
    tinygltf::Model model = triangleModel();
    model.meshes[0].primitives.push_back(primitiveOf(model));
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, RejectsNonTrianglePrimitive) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).mode = TINYGLTF_MODE_LINE;
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, RejectsMissingAttributes) {
    for (const char* name : {"POSITION", "NORMAL", "TEXCOORD_0"}) {
        tinygltf::Model model = triangleModel();
        primitiveOf(model).attributes.erase(name);
        EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error) << name;
    }
}

TEST(GltfLoaderTest, RejectsByteIndices) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).indices = addAccessor(model, std::vector<uint8_t>{0, 1, 2},
                                             TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE, TINYGLTF_TYPE_SCALAR);
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, RejectsMissingIndices) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).indices = -1;
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, RejectsMismatchedAttributeCounts) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).attributes["NORMAL"] = addVec3(model, std::vector<glm::vec3>(2, glm::vec3(0.0f, 0.0f, 1.0f)));
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, RejectsWrongComponentLayout) {
    tinygltf::Model model = triangleModel();
    // a vec2 accessor where a vec3 is expected
    primitiveOf(model).attributes["NORMAL"] = primitiveOf(model).attributes["TEXCOORD_0"];
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, ReadsInterleavedStride) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).attributes["POSITION"] = addAccessor(model, std::vector<glm::vec3>{
        glm::vec3(1.0f), glm::vec3(2.0f), glm::vec3(3.0f)},
        TINYGLTF_COMPONENT_TYPE_FLOAT, TINYGLTF_TYPE_VEC3, 32);
    MeshData data = GltfLoader::fromModel(model);
    EXPECT_EQ(data.vertices[0].position, glm::vec3(1.0f));
    EXPECT_EQ(data.vertices[2].position, glm::vec3(3.0f));
}

TEST(GltfLoaderTest, RejectsOutOfBoundsAccessor) {
    tinygltf::Model model = triangleModel();
    model.accessors[primitiveOf(model).attributes["POSITION"]].count = 4;
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, ReadsTwoMorphTargets) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).targets.push_back(morphTarget(model, 0.1f));
    primitiveOf(model).targets.push_back(morphTarget(model, -0.2f));

    MeshData data = GltfLoader::fromModel(model);
    ASSERT_TRUE(data.hasMorphTargets());
    ASSERT_EQ(data.morphs.size(), 3u);
    EXPECT_EQ(data.morphs[0].position0, glm::vec3(0.1f));
    EXPECT_EQ(data.morphs[0].normal0, glm::vec3(0.0f, 0.1f, 0.0f));
    EXPECT_EQ(data.morphs[2].position1, glm::vec3(-0.2f));
    EXPECT_EQ(data.morphs[2].normal1, glm::vec3(0.0f, -0.2f, 0.0f));
}

TEST(GltfLoaderTest, RejectsSingleMorphTarget) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).targets.push_back(morphTarget(model, 0.1f));
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, RejectsMorphTargetOfWrongLength) {
    tinygltf::Model model = triangleModel();
    primitiveOf(model).targets.push_back(morphTarget(model, 0.1f));
    std::map<std::string, int> shortTarget;
    shortTarget["POSITION"] = addVec3(model, std::vector<glm::vec3>(2, glm::vec3(0.0f)));
    shortTarget["NORMAL"] = addVec3(model, std::vector<glm::vec3>(2, glm::vec3(0.0f)));
    primitiveOf(model).targets.push_back(shortTarget);
    EXPECT_THROW(GltfLoader::fromModel(model), std::runtime_error);
}

TEST(GltfLoaderTest, MissingFileThrows) {
    EXPECT_THROW(GltfLoader::load("does-not-exist.glb"), std::runtime_error);
    EXPECT_THROW(GltfLoader::load("does-not-exist.gltf"), std::runtime_error);
}
