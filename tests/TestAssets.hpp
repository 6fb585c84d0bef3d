#ifndef TESTASSETS_HPP
#define TESTASSETS_HPP

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace TestAssets {

// axis-aligned box as OBJ object, 'first' is the 1-based index of its first vertex
inline void writeBoxObject(std::ofstream &obj, const std::string &name, const int first,
                           const float x0, const float y0, const float z0,
                           const float sx, const float sy, const float sz)
{
    obj << "o " << name << "\n";
    for(int i(0); i<8; i++) {
        obj << "v " << x0+((i&4) ? sx : 0) << " " << y0+((i&2) ? sy : 0) << " " << z0+((i&1) ? sz : 0) << "\n";
    }
    // two triangles per side, counter-clockwise seen from outside
    const int quads[6][4] = {
        {0, 1, 3, 2}, // -x
        {4, 6, 7, 5}, // +x
        {0, 4, 5, 1}, // -y
        {2, 3, 7, 6}, // +y
        {0, 2, 6, 4}, // -z
        {1, 5, 7, 3}, // +z
    };
    for(const auto &q : quads) {
        obj << "f " << first+q[0] << " " << first+q[1] << " " << first+q[2] << "\n";
        obj << "f " << first+q[0] << " " << first+q[2] << " " << first+q[3] << "\n";
    }
}

inline fs::path writeCube(const fs::path &path) {
    std::ofstream obj(path);
    writeBoxObject(obj, "cube", 1, 0, 0, 0, 1, 1, 1);
    return path;
}

// two separate boxes of different size
inline fs::path writeTwoBoxes(const fs::path &path) {
    std::ofstream obj(path);
    writeBoxObject(obj, "small", 1, 0, 0, 0, 1, 1, 1);
    writeBoxObject(obj, "large", 9, 3, -1, 2, 2, 4, 2);
    return path;
}

// single triangle with all vertices in one point
inline fs::path writeDegenerate(const fs::path &path) {
    std::ofstream obj(path);
    obj << "o point\n";
    obj << "v 0.5 0.5 0.5\nv 0.5 0.5 0.5\nv 0.5 0.5 0.5\n";
    obj << "f 1 2 3\n";
    return path;
}

inline fs::path makeTempDir(const std::string &name) {
    const fs::path dir = fs::temp_directory_path() / ("multiviewrender_"+name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

}

#endif // TESTASSETS_HPP
