#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <random>
#include <string>
#include <unistd.h>

namespace mtcopy::testing {

// Временный каталог, удаляется в деструкторе
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string name = info ? info->name() : "mtcopy";
        path_ = std::filesystem::temp_directory_path() /
                ("mtcopy-" + name + "-" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(const std::filesystem::path& rel) const -> std::filesystem::path {
        return path_ / rel;
    }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Содержимое дерева: относительный путь -> содержимое файла ("<dir>" для каталогов,
// "-> target" для ссылок)
inline auto snapshot_tree(const std::filesystem::path& root) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> tree;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        const auto rel = entry.path().lexically_relative(root).string();
        if (entry.is_symlink()) {
            tree[rel] = "-> " + std::filesystem::read_symlink(entry.path()).string();
        } else if (entry.is_directory()) {
            tree[rel] = "<dir>";
        } else {
            tree[rel] = read_file(entry.path());
        }
    }
    return tree;
}

// Строка детерминированного содержимого заданного размера
inline auto make_content(std::size_t size, unsigned seed) -> std::string {
    std::string data(size, '\0');
    std::mt19937 gen(seed);
    for (auto& c : data) {
        c = static_cast<char>(gen() & 0xFF);
    }
    return data;
}

inline bool running_as_root() {
    return ::geteuid() == 0;
}

} // namespace mtcopy::testing
