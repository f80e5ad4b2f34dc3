// src/filesystem_remote_store.cpp
#include "filesystem_remote_store.hpp"

#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "chunk_config.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

namespace PackageSync
{
    namespace Remote
    {

        FilesystemRemoteStore::FilesystemRemoteStore(fs::path root) : root_dir(std::move(root))
        {
            Config::ChunkConfig::ensureDirectoryExists(root_dir);
        }

        fs::path FilesystemRemoteStore::objectPath(const std::string &key) const
        {
            if (key.empty() || key.front() == '/' || key.back() == '/')
            {
                throw std::invalid_argument("Invalid object key: '" + key + "'");
            }

            fs::path path = root_dir;
            std::istringstream segments(key);
            std::string segment;
            while (std::getline(segments, segment, '/'))
            {
                if (segment.empty() || segment == "." || segment == ".." || segment.find('\\') != std::string::npos)
                {
                    throw std::invalid_argument("Invalid object key: '" + key + "'");
                }
                path /= segment;
            }
            return path;
        }

        bool FilesystemRemoteStore::exists(const std::string &key)
        {
            std::error_code ec;
            bool found = fs::is_regular_file(objectPath(key), ec);
            if (ec && ec != std::errc::no_such_file_or_directory)
            {
                throw RemoteStoreError("Existence check failed for " + key + ": " + ec.message());
            }
            return found;
        }

        void FilesystemRemoteStore::putObject(const std::string &key, const std::vector<char> &bytes)
        {
            fs::path object_path = objectPath(key);
            try
            {
                Config::ChunkConfig::ensureDirectoryExists(object_path.parent_path(), true);
            }
            catch (const std::runtime_error &e)
            {
                throw RemoteStoreError("Cannot create parent directory for " + key + ": " + e.what());
            }

            // Each writer fills its own temp file and renames it over the key, so
            // concurrent writers of one key resolve to last-writer-wins.
            const fs::path temp_path = Config::ChunkConfig::temporarySibling(object_path);
            {
                std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw RemoteStoreError("Failed to open object for writing: " + key);
                }
                ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
                if (!ofs.good())
                {
                    ofs.close();
                    std::error_code ignored;
                    fs::remove(temp_path, ignored);
                    throw RemoteStoreError("Failed to write object: " + key);
                }
            }

            std::error_code ec;
            fs::rename(temp_path, object_path, ec);
            if (ec)
            {
                const std::string reason = ec.message();
                std::error_code ignored;
                fs::remove(temp_path, ignored);
                throw RemoteStoreError("Failed to commit object " + key + ": " + reason);
            }
        }

        std::vector<char> FilesystemRemoteStore::getObject(const std::string &key)
        {
            fs::path object_path = objectPath(key);
            std::ifstream ifs(object_path, std::ios::binary);
            if (!ifs.is_open())
            {
                if (!fs::exists(object_path))
                {
                    throw ObjectNotFoundError(key);
                }
                throw RemoteStoreError("Failed to open object for reading: " + key);
            }
            std::vector<char> bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
            if (ifs.bad())
            {
                throw RemoteStoreError("Failed to read object: " + key);
            }
            return bytes;
        }

        std::vector<std::string> FilesystemRemoteStore::listCommonPrefixes(const std::string &prefix,
                                                                           const std::string &delimiter)
        {
            if (delimiter.empty())
            {
                throw std::invalid_argument("listCommonPrefixes requires a delimiter");
            }

            // Only the directory the prefix names is visited: "staging/1" lists
            // entries of root/staging whose names start with "1".
            const size_t slash = prefix.rfind('/');
            const std::string dir_key = slash == std::string::npos ? "" : prefix.substr(0, slash);
            const std::string dir_part = slash == std::string::npos ? "" : prefix.substr(0, slash + 1);
            const std::string name_part = prefix.substr(dir_part.size());
            const fs::path dir = dir_key.empty() ? root_dir : objectPath(dir_key);

            std::set<std::string> prefixes;
            std::error_code ec;
            if (!fs::is_directory(dir, ec))
            {
                return {};
            }

            for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
            {
                const std::string name = it->path().filename().string();
                if (name.compare(0, name_part.size(), name_part) != 0)
                {
                    continue;
                }

                const size_t pos = name.find(delimiter, name_part.size());
                std::error_code type_ec;
                if (pos != std::string::npos)
                {
                    if (it->is_regular_file(type_ec) || (it->is_directory(type_ec) && containsObject(it->path())))
                    {
                        prefixes.insert(dir_part + name.substr(0, pos + delimiter.size()));
                    }
                }
                else if (it->is_directory(type_ec))
                {
                    if (delimiter == "/")
                    {
                        if (containsObject(it->path()))
                        {
                            prefixes.insert(dir_part + name + "/");
                        }
                    }
                    else
                    {
                        // The delimiter may sit deeper in the key; only this subtree can hold it
                        collectPrefixesBelow(it->path(), prefix, delimiter, prefixes);
                    }
                }
            }
            if (ec)
            {
                throw RemoteStoreError("Failed to list objects under " + prefix + ": " + ec.message());
            }
            return std::vector<std::string>(prefixes.begin(), prefixes.end());
        }

        bool FilesystemRemoteStore::containsObject(const fs::path &dir) const
        {
            std::error_code ec;
            for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
                 it.increment(ec))
            {
                std::error_code type_ec;
                if (it->is_regular_file(type_ec))
                {
                    return true;
                }
            }
            if (ec)
            {
                throw RemoteStoreError("Failed to list objects under " + dir.string() + ": " + ec.message());
            }
            return false;
        }

        void FilesystemRemoteStore::collectPrefixesBelow(const fs::path &dir, const std::string &prefix,
                                                         const std::string &delimiter,
                                                         std::set<std::string> &prefixes) const
        {
            std::error_code ec;
            for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
                 it.increment(ec))
            {
                std::error_code type_ec;
                if (!it->is_regular_file(type_ec))
                {
                    continue;
                }
                const std::string key = it->path().lexically_relative(root_dir).generic_string();
                const size_t pos = key.find(delimiter, prefix.size());
                if (pos != std::string::npos)
                {
                    prefixes.insert(key.substr(0, pos + delimiter.size()));
                }
            }
            if (ec)
            {
                throw RemoteStoreError("Failed to list objects under " + prefix + ": " + ec.message());
            }
        }

    } // namespace Remote
} // namespace PackageSync
