#include "rpc/Serializer.hpp"

#include "engine/TrackerHealth.hpp"
#include "utils/Json.hpp"

#include <yyjson.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

namespace sw::rpc
{

namespace
{

constexpr std::uint32_t kColorGreen = 0x00FF00;
constexpr std::uint32_t kColorYellow = 0xFFFF00;
constexpr std::uint32_t kColorRed = 0xFF0000;
constexpr std::size_t kListPreview = 5;

yyjson_val *array_root(json::Document const &doc)
{
    if (!doc.is_valid())
    {
        return nullptr;
    }
    auto *root = doc.root();
    return root != nullptr && yyjson_is_arr(root) ? root : nullptr;
}

void add_field(yyjson_mut_doc *doc, yyjson_mut_val *fields,
               char const *name, std::string const &value, bool inline_field)
{
    auto *field = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_str(doc, field, "name", name);
    yyjson_mut_obj_add_strcpy(doc, field, "value", value.c_str());
    yyjson_mut_obj_add_bool(doc, field, "inline", inline_field);
    yyjson_mut_arr_append(fields, field);
}

std::string bullet_list(std::vector<std::string> const &items)
{
    std::string text;
    auto shown = std::min(items.size(), kListPreview);
    for (std::size_t i = 0; i < shown; ++i)
    {
        if (!text.empty())
        {
            text.push_back('\n');
        }
        text += "• " + items[i];
    }
    if (items.size() > kListPreview)
    {
        text += std::format("\n... and {} more", items.size() - kListPreview);
    }
    return text;
}

std::string embed_payload(json::MutableDocument &doc, yyjson_mut_val *embed)
{
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    auto *embeds = yyjson_mut_arr(native);
    yyjson_mut_arr_append(embeds, embed);
    yyjson_mut_obj_add_val(native, root, "embeds", embeds);
    return doc.write("{}");
}

} // namespace

std::optional<std::vector<engine::TorrentRecord>>
parse_torrent_list(std::string_view payload)
{
    auto doc = json::Document::parse(payload);
    auto *root = array_root(doc);
    if (root == nullptr)
    {
        return std::nullopt;
    }
    std::vector<engine::TorrentRecord> result;
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(root, idx, limit, entry)
    {
        if (!yyjson_is_obj(entry))
        {
            continue;
        }
        auto hash = json::string_member(entry, "hash");
        if (!hash)
        {
            continue;
        }
        engine::TorrentRecord record;
        record.id = std::move(*hash);
        record.name = json::string_member(entry, "name").value_or(record.id);
        record.save_path = json::string_member(entry, "save_path").value_or("");
        record.ratio = std::max(0.0, json::number_member(entry, "ratio").value_or(0.0));
        record.seeding_time = std::chrono::seconds(
            std::max<std::int64_t>(0, json::int_member(entry, "seeding_time").value_or(0)));
        auto total = json::int_member(entry, "total_size");
        if (!total)
        {
            total = json::int_member(entry, "size");
        }
        record.total_size = static_cast<std::uint64_t>(std::max<std::int64_t>(0, total.value_or(0)));
        result.push_back(std::move(record));
    }
    return result;
}

std::optional<std::vector<TorrentFileEntry>>
parse_file_list(std::string_view payload)
{
    auto doc = json::Document::parse(payload);
    auto *root = array_root(doc);
    if (root == nullptr)
    {
        return std::nullopt;
    }
    std::vector<TorrentFileEntry> result;
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(root, idx, limit, entry)
    {
        auto name = json::string_member(entry, "name");
        if (!name || name->empty())
        {
            continue;
        }
        TorrentFileEntry file;
        file.name = std::move(*name);
        file.size = static_cast<std::uint64_t>(
            std::max<std::int64_t>(0, json::int_member(entry, "size").value_or(0)));
        result.push_back(std::move(file));
    }
    return result;
}

std::optional<std::vector<engine::TrackerRef>>
parse_tracker_list(std::string_view payload)
{
    auto doc = json::Document::parse(payload);
    auto *root = array_root(doc);
    if (root == nullptr)
    {
        return std::nullopt;
    }
    std::vector<engine::TrackerRef> result;
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(root, idx, limit, entry)
    {
        auto url = json::string_member(entry, "url");
        if (!url)
        {
            continue;
        }
        engine::TrackerRef tracker;
        tracker.tier = engine::classify_tracker_url(*url);
        tracker.url = std::move(*url);
        tracker.message = json::string_member(entry, "msg").value_or("");
        result.push_back(std::move(tracker));
    }
    return result;
}

std::string format_gigabytes(std::uint64_t bytes)
{
    return std::format("{:.2f} GB", static_cast<double>(bytes) /
                                        (1024.0 * 1024.0 * 1024.0));
}

std::string serialize_summary_embed(engine::RunSummary const &summary,
                                    std::string const &timestamp)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *embed = yyjson_mut_obj(native);

    std::uint32_t color = kColorGreen;
    if (summary.torrents_deleted > 0)
    {
        color = summary.dry_run ? kColorYellow : kColorRed;
    }
    auto title = std::format("{}SeedWarden Summary",
                             summary.dry_run ? "[DRY RUN] " : "");
    yyjson_mut_obj_add_strcpy(native, embed, "title", title.c_str());
    yyjson_mut_obj_add_uint(native, embed, "color", color);
    yyjson_mut_obj_add_strcpy(native, embed, "timestamp", timestamp.c_str());

    auto *fields = yyjson_mut_arr(native);
    add_field(native, fields, "Torrents Processed",
              std::to_string(summary.torrents_processed), true);
    add_field(native, fields, "Torrents Deleted",
              std::to_string(summary.torrents_deleted), true);
    add_field(native, fields, "Torrents Kept",
              std::to_string(summary.torrents_kept), true);
    if (summary.hardlinks_attempted > 0 || summary.hardlinks_fixed > 0)
    {
        add_field(native, fields, "Hardlinks Fixed",
                  std::to_string(summary.hardlinks_fixed), true);
        add_field(native, fields, "Hardlinks Failed",
                  std::to_string(summary.hardlinks_failed), true);
    }
    add_field(native, fields, "Orphaned Files Found",
              std::to_string(summary.orphaned_files_found), true);

    auto const freed = summary.space_freed_dead_tracker_bytes +
                       summary.space_freed_criteria_bytes;
    auto const total = freed + summary.space_saved_hardlinks_bytes;
    if (total > 0)
    {
        std::vector<std::string> parts;
        if (summary.space_freed_dead_tracker_bytes > 0)
        {
            parts.push_back(std::format(
                "Dead trackers: {}",
                format_gigabytes(summary.space_freed_dead_tracker_bytes)));
        }
        if (summary.space_freed_criteria_bytes > 0)
        {
            parts.push_back(std::format(
                "Criteria: {}", format_gigabytes(summary.space_freed_criteria_bytes)));
        }
        if (summary.space_saved_hardlinks_bytes > 0)
        {
            parts.push_back(std::format(
                "Hardlinks: {}", format_gigabytes(summary.space_saved_hardlinks_bytes)));
        }
        auto value = format_gigabytes(total);
        if (parts.size() > 1)
        {
            std::string joined;
            for (auto const &part : parts)
            {
                joined += joined.empty() ? part : ", " + part;
            }
            value += "\n(" + joined + ")";
        }
        add_field(native, fields, "Space Saved", value, true);
    }

    if (!summary.deletion_reasons.empty())
    {
        std::vector<std::string> reasons;
        for (auto const &[reason, count] : summary.deletion_reasons)
        {
            reasons.push_back(std::format("{}: {}", reason, count));
        }
        add_field(native, fields, "Deletion Reasons", bullet_list(reasons), false);
    }
    if (!summary.deleted_torrents.empty())
    {
        add_field(native, fields, "Deleted Torrents",
                  bullet_list(summary.deleted_torrents), false);
    }
    if (!summary.hardlink_failures.empty())
    {
        std::vector<std::string> failures;
        for (auto const &failure : summary.hardlink_failures)
        {
            failures.push_back(std::format("{} ({}): {}",
                                           failure.file.filename().string(),
                                           engine::to_string(failure.action),
                                           failure.message));
        }
        add_field(native, fields, "Hardlink Failures", bullet_list(failures),
                  false);
    }
    if (!summary.errors.empty())
    {
        add_field(native, fields, "Errors", bullet_list(summary.errors), false);
    }
    yyjson_mut_obj_add_val(native, embed, "fields", fields);

    auto *footer = yyjson_mut_obj(native);
    yyjson_mut_obj_add_str(native, footer, "text", "SeedWarden");
    yyjson_mut_obj_add_val(native, embed, "footer", footer);

    return embed_payload(doc, embed);
}

std::string serialize_error_embed(std::string const &message,
                                  std::string const &timestamp)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *embed = yyjson_mut_obj(native);
    yyjson_mut_obj_add_str(native, embed, "title", "SeedWarden Error");
    yyjson_mut_obj_add_strcpy(native, embed, "description", message.c_str());
    yyjson_mut_obj_add_uint(native, embed, "color", kColorRed);
    yyjson_mut_obj_add_strcpy(native, embed, "timestamp", timestamp.c_str());
    return embed_payload(doc, embed);
}

} // namespace sw::rpc
