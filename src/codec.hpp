#ifndef LOCALSYNC_CACHE_CODEC_HPP
#define LOCALSYNC_CACHE_CODEC_HPP

/**
 * @file codec.hpp
 * @brief JSON helpers for the nested columns of the cache tables.
 *
 * This is the only place where typed nested data is turned into text:
 *
 *   metadata     → TEXT (JSON object of scalars)
 *   attachment   → TEXT (JSON object, NULL when absent)
 *   string lists → TEXT (JSON array)
 *
 * Decoding is lenient: a column that does not parse yields an empty value
 * instead of failing the whole row. Encoding fails with ValidationError
 * (for instance on a string that is not valid UTF-8).
 */

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <nlohmann/json.hpp>

#include <localsync/cache/errors.hpp>
#include <localsync/cache/types.hpp>

namespace localsync::cache::detail
{
    inline std::string dump_column(const nlohmann::json &j, const char *column)
    {
        try
        {
            return j.dump();
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ValidationError(std::string("cannot encode ") + column + ": " + e.what());
        }
    }

    inline nlohmann::json metadata_value_to_json(const MetadataValue &v)
    {
        nlohmann::json j = nullptr;
        std::visit(
            [&](auto &&val)
            {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                    j = nullptr;
                else
                    j = val;
            },
            v);
        return j;
    }

    inline nlohmann::json metadata_to_json(const Metadata &meta)
    {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto &[key, value] : meta)
        {
            obj[key] = metadata_value_to_json(value);
        }
        return obj;
    }

    inline Metadata metadata_from_json(const nlohmann::json &j)
    {
        Metadata meta;
        if (!j.is_object())
            return meta;

        for (auto it = j.begin(); it != j.end(); ++it)
        {
            const nlohmann::json &val = *it;

            if (val.is_string())
                meta.emplace(it.key(), val.get<std::string>());
            else if (val.is_boolean())
                meta.emplace(it.key(), val.get<bool>());
            else if (val.is_number_integer())
                meta.emplace(it.key(), val.get<long long>());
            else if (val.is_number_float())
                meta.emplace(it.key(), val.get<double>());
            else if (val.is_null())
                meta.emplace(it.key(), std::monostate{});
            // nested arrays / objects are not part of the cached model
        }
        return meta;
    }

    inline std::string encode_metadata(const Metadata &meta)
    {
        return dump_column(metadata_to_json(meta), "metadata");
    }

    inline Metadata decode_metadata(std::string_view text)
    {
        auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded())
            return {};
        return metadata_from_json(j);
    }

    inline std::optional<std::string> encode_attachment(const std::optional<Attachment> &att)
    {
        if (!att)
            return std::nullopt;

        nlohmann::json j = nlohmann::json::object();
        j["url"] = att->url;
        j["file_name"] = att->fileName;
        j["mime_type"] = att->mimeType;
        if (att->fileSize)
            j["file_size"] = *att->fileSize;
        if (att->thumbnailUrl)
            j["thumbnail_url"] = *att->thumbnailUrl;
        return dump_column(j, "attachment");
    }

    inline std::optional<Attachment> decode_attachment(std::string_view text)
    {
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;

        Attachment att;
        att.url = j.value("url", std::string{});
        att.fileName = j.value("file_name", std::string{});
        att.mimeType = j.value("mime_type", std::string{});
        if (j.contains("file_size") && j["file_size"].is_number_integer())
            att.fileSize = j["file_size"].get<std::int64_t>();
        if (j.contains("thumbnail_url") && j["thumbnail_url"].is_string())
            att.thumbnailUrl = j["thumbnail_url"].get<std::string>();
        return att;
    }

    inline std::string encode_string_list(const std::vector<std::string> &list)
    {
        return dump_column(nlohmann::json(list), "string list");
    }

    inline std::vector<std::string> decode_string_list(std::string_view text)
    {
        std::vector<std::string> out;
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_array())
            return out;

        for (const auto &el : j)
        {
            if (el.is_string())
                out.push_back(el.get<std::string>());
        }
        return out;
    }

} // namespace localsync::cache::detail

#endif // LOCALSYNC_CACHE_CODEC_HPP
