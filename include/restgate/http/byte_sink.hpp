#pragma once

#include "../export.hpp"

#include <cstddef>
#include <string>

namespace restgate
{
    namespace http
    {

        /**
         * @brief Destination for response bytes
         */
        class RESTGATE_SERVER_API IByteSink
        {
        public:
            virtual ~IByteSink() = default;

            // Write all bytes or return false
            virtual bool write(const char *data, size_t length) = 0;
            virtual void close() = 0;

            bool write(const std::string &data) { return write(data.data(), data.size()); }
        };

        /**
         * @brief Collects the response in memory
         */
        class RESTGATE_SERVER_API StringSink : public IByteSink
        {
        public:
            using IByteSink::write;

            bool write(const char *data, size_t length) override
            {
                if (closed_)
                {
                    return false;
                }
                data_.append(data, length);
                return true;
            }

            void close() override { closed_ = true; }

            const std::string &data() const { return data_; }
            bool closed() const { return closed_; }

        private:
#pragma warning(push)
#pragma warning(disable: 4251)
            std::string data_;
#pragma warning(pop)
            bool closed_ = false;
        };

    } // namespace http
} // namespace restgate
