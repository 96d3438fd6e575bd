#pragma once
/** @file  TempDir.hpp
 *  @brief Scratch directory removed at scope exit.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fwdeploy {
  namespace test {

    class TempDir {
    public:
      TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "fwdeploy-XXXXXX").string();
        if (!::mkdtemp(tmpl.data()))
          throw std::runtime_error("mkdtemp failed");
        path_ = std::filesystem::canonical(tmpl);
      }
      ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
      }

      TempDir(const TempDir&) = delete;
      TempDir& operator=(const TempDir&) = delete;

      const std::filesystem::path& path() const { return path_; }
      std::string str() const { return path_.string(); }
      std::string file(const std::string& rel) const { return (path_ / rel).string(); }

      /// Creates \p absPath (and its parents) with \p content.
      static void touch(const std::string& absPath, const std::string& content = "x") {
        std::filesystem::create_directories(std::filesystem::path(absPath).parent_path());
        std::ofstream(absPath) << content;
      }

    private:
      std::filesystem::path path_;
    };

  } // namespace test
} // namespace fwdeploy
