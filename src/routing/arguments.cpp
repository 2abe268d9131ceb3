#include "restgate/routing/arguments.hpp"

namespace restgate
{
    namespace routing
    {

        void Arguments::add(const std::string &name, BoundValue value)
        {
            values_.emplace_back(name, std::move(value));
        }

        const BoundValue *Arguments::find(const std::string &name) const
        {
            for (const auto &entry : values_)
            {
                if (entry.first == name)
                {
                    return &entry.second;
                }
            }
            return nullptr;
        }

        const BoundValue &Arguments::value(const std::string &name) const
        {
            const BoundValue *found = find(name);
            if (!found)
            {
                throw std::out_of_range("No argument named '" + name + "'");
            }
            return *found;
        }

        bool Arguments::has(const std::string &name) const
        {
            const BoundValue *found = find(name);
            if (!found || std::holds_alternative<std::monostate>(*found))
            {
                return false;
            }
            if (const auto *doc = std::get_if<nlohmann::json>(found))
            {
                return !doc->is_null();
            }
            return true;
        }

        const nlohmann::json &Arguments::json(const std::string &name) const
        {
            static const nlohmann::json null_document;

            const BoundValue *found = find(name);
            if (found)
            {
                if (const auto *doc = std::get_if<nlohmann::json>(found))
                {
                    return *doc;
                }
            }
            return null_document;
        }

        std::shared_ptr<http::IFormFile> Arguments::file(const std::string &name) const
        {
            const BoundValue *found = find(name);
            if (found)
            {
                if (const auto *handle = std::get_if<std::shared_ptr<http::IFormFile>>(found))
                {
                    return *handle;
                }
            }
            return nullptr;
        }

        const http::FormField *Arguments::field(const std::string &name) const
        {
            const BoundValue *found = find(name);
            return found ? std::get_if<http::FormField>(found) : nullptr;
        }

        const std::string *Arguments::bytes(const std::string &name) const
        {
            const BoundValue *found = find(name);
            if (found)
            {
                if (const auto *raw = std::get_if<ByteArray>(found))
                {
                    return &raw->data;
                }
            }
            return nullptr;
        }

        RequestContext *Arguments::context(const std::string &name) const
        {
            const BoundValue *found = find(name);
            if (found)
            {
                if (const auto *ctx = std::get_if<RequestContext *>(found))
                {
                    return *ctx;
                }
            }
            return nullptr;
        }

    } // namespace routing
} // namespace restgate
