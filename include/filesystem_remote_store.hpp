// include/filesystem_remote_store.hpp
#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "remote_store.hpp"

namespace PackageSync
{
    namespace Remote
    {

        // Object store backed by a directory tree: key "a/b/c" is the file
        // root/a/b/c. Used as the default target of the control service and as
        // a stand-in for a cloud bucket (a mounted bucket or a staging mirror).
        class FilesystemRemoteStore : public RemoteStore
        {
        public:
            explicit FilesystemRemoteStore(std::filesystem::path root);

            using RemoteStore::putObject;

            bool exists(const std::string &key) override;
            void putObject(const std::string &key, const std::vector<char> &bytes) override;
            std::vector<char> getObject(const std::string &key) override;
            std::vector<std::string> listCommonPrefixes(const std::string &prefix,
                                                        const std::string &delimiter) override;

            const std::filesystem::path &root() const { return root_dir; }

        private:
            std::filesystem::path root_dir;

            // Throws std::invalid_argument for keys that could escape the root.
            std::filesystem::path objectPath(const std::string &key) const;

            // True if any object lives somewhere below dir.
            bool containsObject(const std::filesystem::path &dir) const;

            // Full walk of one subtree, for delimiters other than "/".
            void collectPrefixesBelow(const std::filesystem::path &dir, const std::string &prefix,
                                      const std::string &delimiter, std::set<std::string> &prefixes) const;
        };

    } // namespace Remote
} // namespace PackageSync
