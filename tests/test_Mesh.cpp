#include <gtest/gtest.h>

#include <Mesh.hpp>
#include <Errors.hpp>

#include <algorithm>

namespace {

Mesh makeTriangle(const std::array<float, 3> &a, const std::array<float, 3> &b, const std::array<float, 3> &c) {
    Mesh mesh;
    mesh.vertices = {a, b, c};
    mesh.faces = {{0, 1, 2}};
    return mesh;
}

// irregular point cloud with faces, far away from the origin
Mesh makeOffsetMesh() {
    Mesh mesh;
    mesh.vertices = {{10, 20, 30}, {14, 20, 30}, {10, 22, 30}, {11, 21, 35}, {13, 20.5, 31}};
    mesh.faces = {{0, 1, 2}, {0, 1, 3}, {1, 2, 4}, {2, 3, 4}};
    return mesh;
}

}

TEST(Mesh, NormaliseCentresAndScales) {
    Mesh mesh = makeOffsetMesh();
    mesh.normalise();

    const std::array<float, 3> c = mesh.centroid();
    for(const float v : c)
        EXPECT_NEAR(v, 0.0f, 1e-5f);

    const std::array<float, 3> ext = mesh.extents();
    EXPECT_NEAR(*std::max_element(ext.begin(), ext.end()), 1.0f, 1e-5f);
    // uniform scale: x extent 4, z extent 5 before
    EXPECT_NEAR(ext[0], 0.8f, 1e-5f);
    EXPECT_NEAR(ext[2], 1.0f, 1e-5f);

    // topology unchanged
    EXPECT_EQ(mesh.faces.size(), 4u);
}

TEST(Mesh, NormaliseFlatMesh) {
    // zero extent along z only is fine
    Mesh mesh = makeTriangle({0, 0, 1}, {2, 0, 1}, {0, 3, 1});
    EXPECT_NO_THROW(mesh.normalise());
    const std::array<float, 3> ext = mesh.extents();
    EXPECT_NEAR(ext[1], 1.0f, 1e-6f);
    EXPECT_NEAR(ext[2], 0.0f, 1e-6f);
}

TEST(Mesh, NormaliseTinyMesh) {
    // model authored in the wrong unit, still a valid triangle
    Mesh mesh = makeTriangle({0, 0, 0}, {1e-8f, 0, 0}, {0, 1e-8f, 0});
    EXPECT_NO_THROW(mesh.normalise());

    const std::array<float, 3> ext = mesh.extents();
    EXPECT_NEAR(ext[0], 1.0f, 1e-5f);
    EXPECT_NEAR(ext[1], 1.0f, 1e-5f);
    for(const float v : mesh.centroid())
        EXPECT_NEAR(v, 0.0f, 1e-5f);
}

TEST(Mesh, DegenerateMeshThrows) {
    Mesh point = makeTriangle({1, 2, 3}, {1, 2, 3}, {1, 2, 3});
    EXPECT_THROW(point.normalise(), DegenerateMeshError);

    Mesh empty;
    EXPECT_THROW(empty.normalise(), DegenerateMeshError);
}

TEST(Mesh, AppendRebasesFaceIndices) {
    Mesh merged = makeTriangle({0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    const Mesh second = makeOffsetMesh();

    merged.append(second);

    ASSERT_EQ(merged.vertices.size(), 3u+5u);
    ASSERT_EQ(merged.faces.size(), 1u+4u);

    // faces of the second mesh refer to its own vertices
    for(size_t i = 0; i<second.faces.size(); i++) {
        for(size_t k = 0; k<3; k++) {
            const uint32_t idx = merged.faces[1+i][k];
            EXPECT_EQ(idx, second.faces[i][k]+3);
            EXPECT_EQ(merged.vertices[idx], second.vertices[second.faces[i][k]]);
        }
    }
    EXPECT_FALSE(merged.hasColour());
}

TEST(Mesh, AppendFillsMissingColour) {
    Mesh merged = makeTriangle({0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    Mesh red = makeTriangle({0, 0, 1}, {1, 0, 1}, {0, 1, 1});
    red.colour = {{1, 0, 0}, {1, 0, 0}, {1, 0, 0}};

    merged.append(red);
    merged.append(makeTriangle({0, 0, 2}, {1, 0, 2}, {0, 1, 2}));

    ASSERT_EQ(merged.colour.size(), merged.vertices.size());
    EXPECT_FLOAT_EQ(merged.colour[0][0], Mesh::default_grey);
    EXPECT_FLOAT_EQ(merged.colour[3][0], 1.0f);
    EXPECT_FLOAT_EQ(merged.colour[3][1], 0.0f);
    EXPECT_FLOAT_EQ(merged.colour[8][2], Mesh::default_grey);
}

TEST(Mesh, FaceNormals) {
    Mesh mesh = makeTriangle({0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    mesh.vertices.push_back({5, 5, 5});
    mesh.faces.push_back({3, 3, 3});

    const Point3DList normals = mesh.faceNormals();
    ASSERT_EQ(normals.size(), 2u);
    EXPECT_FLOAT_EQ(normals[0][2], 1.0f);
    EXPECT_FLOAT_EQ(normals[0][0], 0.0f);
    // no area, no normal
    EXPECT_FLOAT_EQ(normals[1][0], 0.0f);
    EXPECT_FLOAT_EQ(normals[1][1], 0.0f);
    EXPECT_FLOAT_EQ(normals[1][2], 0.0f);
}
