// include/remote_store.hpp
#pragma once

#include <string>
#include <vector>

namespace PackageSync
{
    namespace Remote
    {

        // The object-store operations the orchestrator relies on, independent of
        // transport. Implementations report transport failures as
        // RemoteStoreError and a missing object on getObject() as
        // ObjectNotFoundError. Single-object writes are expected to be atomic
        // with last-writer-wins semantics.
        class RemoteStore
        {
        public:
            virtual ~RemoteStore() = default;

            virtual bool exists(const std::string &key) = 0;
            virtual void putObject(const std::string &key, const std::vector<char> &bytes) = 0;
            virtual std::vector<char> getObject(const std::string &key) = 0;

            // Distinct key prefixes up to and including the first delimiter
            // after prefix, e.g. listCommonPrefixes("staging/", "/") yields
            // "staging/1.0.0/", "staging/1.0.1/", ... in ascending order.
            virtual std::vector<std::string> listCommonPrefixes(const std::string &prefix,
                                                                const std::string &delimiter) = 0;

            void putObject(const std::string &key, const std::string &text)
            {
                putObject(key, std::vector<char>(text.begin(), text.end()));
            }

            std::string getObjectAsString(const std::string &key)
            {
                std::vector<char> bytes = getObject(key);
                return std::string(bytes.begin(), bytes.end());
            }
        };

    } // namespace Remote
} // namespace PackageSync
