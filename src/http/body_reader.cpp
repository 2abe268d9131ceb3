#include "restgate/http/body_reader.hpp"
#include "restgate/http/errors.hpp"
#include "restgate/logger.hpp"

#include <algorithm>
#include <cstring>
#include <vector>

namespace restgate
{
    namespace http
    {

        long StringByteSource::read(char *buffer, size_t length)
        {
            size_t available = data_.size() - offset_;
            size_t count = std::min(available, length);
            if (count == 0)
            {
                return 0;
            }
            std::memcpy(buffer, data_.data() + offset_, count);
            offset_ += count;
            return static_cast<long>(count);
        }

        std::string BodyReader::read(IByteSource &source, std::optional<size_t> declaredLength) const
        {
            if (declaredLength && *declaredLength > maxBytes_)
            {
                throw PayloadTooLargeError(maxBytes_, *declaredLength);
            }

            std::vector<char> buffer(65536);
            std::string body;
            size_t expected = declaredLength.value_or(0);

            while (body.size() < expected)
            {
                size_t want = std::min(buffer.size(), expected - body.size());
                long n = source.read(buffer.data(), want);
                if (n <= 0)
                {
                    ServerLogger::logWarning("Request body ended after %zu of %zu declared bytes",
                                             body.size(), expected);
                    return body;
                }
                body.append(buffer.data(), static_cast<size_t>(n));
            }

            // Bytes beyond the declared length still count against the limit
            while (source.hasPending())
            {
                long n = source.read(buffer.data(), buffer.size());
                if (n <= 0)
                {
                    break;
                }
                body.append(buffer.data(), static_cast<size_t>(n));
                if (body.size() > maxBytes_)
                {
                    ServerLogger::logWarning("Request body exceeded %zu bytes while streaming (declared %zu)",
                                             maxBytes_, expected);
                    throw PayloadTooLargeError(maxBytes_, body.size());
                }
            }

            return body;
        }

    } // namespace http
} // namespace restgate
