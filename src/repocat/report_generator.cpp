#include <repocat/report_generator.hpp>
#include <repocat/file_scanner.hpp>
#include <repocat/summary_classifier.hpp>

#include <nlohmann/json.hpp>

#include <exception>
#include <fstream>
#include <sstream>
#include <system_error>

namespace repocat {

namespace {

using ordered_json = nlohmann::ordered_json;

constexpr const char* DRY_RUN_PREFIX = "[DRY RUN] ";

// Hidden sibling used while an artifact is being written
fs::path temp_path_for(const fs::path& target) {
    return target.parent_path() / ("." + target.filename().string() + ".tmp");
}

fs::path backup_path_for(const fs::path& target) {
    return target.parent_path() / ("." + target.filename().string() + ".bak");
}

void remove_quietly(const std::vector<fs::path>& paths) {
    for (const auto& path : paths) {
        std::error_code ec;
        fs::remove(path, ec);  // Best effort; the first error is reported
    }
}

}  // namespace

ReportGenerator::ReportGenerator(Logger* logger)
    : logger_(logger) {}

void ReportGenerator::log_info(const std::string& message) const {
    if (logger_) {
        logger_->info(message);
    }
}

Result<ReportOutcome> ReportGenerator::generate(const fs::path& root,
                                                const fs::path& output_dir,
                                                const ScanFilter& filter,
                                                bool dry_run) const {
    Result<ReportOutcome> result = Error(ErrorCode::INTERNAL_ERROR);
    try {
        result = run(root, output_dir, filter, dry_run);
    } catch (const std::exception& e) {
        result = Error(ErrorCode::INTERNAL_ERROR, e.what());
    }

    if (!result.ok()) {
        if (logger_) {
            logger_->error(result.error().to_string());
        }
        return Error(ErrorCode::REPORT_FAILED,
                     "Failed to generate file summaries: " + result.error().to_string());
    }
    return result;
}

Result<ReportOutcome> ReportGenerator::run(const fs::path& root,
                                           const fs::path& output_dir,
                                           const ScanFilter& filter,
                                           bool dry_run) const {
    FileScanner scanner(logger_);
    auto scanned = scanner.scan(root, filter);
    if (!scanned.ok()) {
        return scanned.error();
    }

    ReportOutcome outcome;
    outcome.dry_run = dry_run;

    const auto& entries = scanned.value();
    if (entries.empty()) {
        log_info(std::string(dry_run ? DRY_RUN_PREFIX : "") +
                 "No files found matching criteria");
        return outcome;
    }

    ReportRecord record = build_record(entries);
    outcome.total_files = record.total_files();

    const std::string markdown = render_markdown(record);
    const std::string json = render_json(record);

    ArtifactInfo markdown_info{output_dir / MARKDOWN_REPORT_NAME, markdown.size(),
                               record.total_files(), false};
    ArtifactInfo json_info{output_dir / JSON_REPORT_NAME, json.size(),
                           record.total_files(), false};

    if (dry_run) {
        const std::string count = std::to_string(record.total_files());
        log_info(std::string(DRY_RUN_PREFIX) + "Would write " + MARKDOWN_REPORT_NAME +
                 " to: " + markdown_info.path.string());
        log_info(std::string(DRY_RUN_PREFIX) + "Content length: " +
                 std::to_string(markdown.size()) + " bytes");
        log_info(std::string(DRY_RUN_PREFIX) + "Total files: " + count);
        log_info(std::string(DRY_RUN_PREFIX) + "Would write " + JSON_REPORT_NAME +
                 " to: " + json_info.path.string());
        log_info(std::string(DRY_RUN_PREFIX) + "JSON entries: " + count);
    } else {
        auto written = write_artifacts({{markdown_info.path, markdown},
                                        {json_info.path, json}});
        if (!written.ok()) {
            return written.error();
        }
        markdown_info.written = true;
        json_info.written = true;
        log_info("File summaries written: " + markdown_info.path.string());
        log_info("File summaries JSON written: " + json_info.path.string());
    }

    outcome.artifacts.push_back(std::move(markdown_info));
    outcome.artifacts.push_back(std::move(json_info));
    return outcome;
}

ReportRecord ReportGenerator::build_record(const std::vector<FileEntry>& entries) {
    ReportRecord record;
    record.files.reserve(entries.size());

    for (const auto& entry : entries) {
        Classification c = SummaryClassifier::classify(entry);
        record.files.push_back(FileSummary{entry.relative_path, std::move(c.language),
                                           std::move(c.summary)});
    }
    return record;
}

std::string ReportGenerator::render_markdown(const ReportRecord& record) {
    std::vector<std::string> lines;
    lines.push_back("# File Summaries\n");
    lines.push_back(
        "Heuristic summaries of source files based on filenames, extensions, and paths.\n");
    lines.push_back("Total files: " + std::to_string(record.total_files()) + "\n");

    for (const auto& file : record.files) {
        lines.push_back("## " + file.path);
        lines.push_back("**Language:** " + file.language + "  ");
        lines.push_back("**Summary:** " + file.summary + "\n");
    }

    std::ostringstream ss;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) ss << "\n";
        ss << lines[i];
    }
    return ss.str();
}

std::string ReportGenerator::render_json(const ReportRecord& record) {
    ordered_json doc;
    doc["total_files"] = record.total_files();
    doc["files"] = ordered_json::array();

    for (const auto& file : record.files) {
        ordered_json item;
        item["path"] = file.path;
        item["language"] = file.language;
        item["summary"] = file.summary;
        doc["files"].push_back(std::move(item));
    }

    // Non-ASCII is escaped; undecodable bytes in names become U+FFFD
    return doc.dump(2, ' ', true, ordered_json::error_handler_t::replace);
}

Result<void> ReportGenerator::write_artifacts(
    const std::vector<std::pair<fs::path, std::string>>& docs) const {
    // Write every document to a temporary first so a failure never leaves
    // one artifact replaced without the other.
    std::vector<fs::path> temps;
    for (const auto& [target, content] : docs) {
        fs::path tmp = temp_path_for(target);
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            remove_quietly(temps);
            return Error(ErrorCode::IO_ERROR, "Cannot open '" + tmp.string() + "' for writing");
        }
        temps.push_back(tmp);

        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            remove_quietly(temps);
            return Error(ErrorCode::IO_ERROR, "Failed to write '" + tmp.string() + "'");
        }
        if (logger_) {
            logger_->debug("Staged " + target.string() + " (" +
                           std::to_string(content.size()) + " bytes)");
        }
    }

    // Move existing artifacts aside so a failed install can be rolled back
    std::vector<std::pair<fs::path, fs::path>> backups;  // (backup, target)
    auto restore = [&backups]() {
        for (const auto& [backup, target] : backups) {
            std::error_code ec;
            fs::rename(backup, target, ec);  // Best effort; the install error is reported
        }
    };

    for (const auto& doc : docs) {
        const fs::path& target = doc.first;
        std::error_code ec;
        if (!fs::exists(target, ec)) continue;

        fs::path backup = backup_path_for(target);
        fs::rename(target, backup, ec);
        if (ec) {
            restore();
            remove_quietly(temps);
            return Error(ErrorCode::IO_ERROR, "Failed to replace '" + target.string() +
                         "': " + ec.message());
        }
        backups.emplace_back(backup, target);
    }

    for (size_t i = 0; i < docs.size(); ++i) {
        std::error_code ec;
        fs::rename(temps[i], docs[i].first, ec);
        if (ec) {
            std::vector<fs::path> installed;
            for (size_t j = 0; j < i; ++j) {
                installed.push_back(docs[j].first);
            }
            remove_quietly(installed);
            restore();
            remove_quietly(temps);
            return Error(ErrorCode::IO_ERROR, "Failed to replace '" +
                         docs[i].first.string() + "': " + ec.message());
        }
    }

    std::vector<fs::path> stale;
    for (const auto& backup : backups) {
        stale.push_back(backup.first);
    }
    remove_quietly(stale);

    return Ok();
}

}  // namespace repocat
