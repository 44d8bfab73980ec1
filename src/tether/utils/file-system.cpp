
#include "file-system.hpp"

#include <cerrno>
#include <cstdio>
#include <memory>

#include <sys/stat.h>

namespace tether
{
// ------------------------------------------------------------ file-get-contents
/**
 * @brief Reads the whole of `fname` into `out`.
 * @return `errno` as a generic error if the file cannot be opened or read.
 */
error_code file_get_contents(const std::string_view fname, std::string& out)
{
   const std::string path{fname};
   std::unique_ptr<FILE, int (*)(FILE*)> fp{fopen(path.c_str(), "rb"), fclose};
   if(fp == nullptr) return {errno, std::generic_category()};

   out.clear();
   char buffer[4096];
   while(true) {
      const auto count = fread(buffer, 1, sizeof(buffer), fp.get());
      out.append(buffer, count);
      if(count < sizeof(buffer)) break;
   }

   if(ferror(fp.get())) return {EIO, std::generic_category()};
   return {};
}

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename)
{
   const std::string path{filename};
   struct stat st_buf;
   if(stat(path.c_str(), &st_buf) == -1) return false;
   return S_ISREG(st_buf.st_mode);
}

bool is_directory(const std::string_view filename)
{
   const std::string path{filename};
   struct stat st_buf;
   if(stat(path.c_str(), &st_buf) == -1) return false;
   return S_ISDIR(st_buf.st_mode);
}

// ---------------------------------------------------------------- join-path

std::string join_path(const std::string_view directory, const std::string_view filename)
{
   if(directory.empty()) return std::string{filename};
   std::string out{directory};
   if(out.back() != '/') out += '/';
   out += filename;
   return out;
}

} // namespace tether
