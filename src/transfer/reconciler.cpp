#include "pushpop/transfer/reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace pushpop::transfer {
namespace fs = std::filesystem;

namespace {

// Regular file (or symlink to one); directories do not count.
std::optional<uint64_t> regular_file_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

std::string lower_trimmed(std::string text) {
    text.erase(text.begin(), std::find_if(text.begin(), text.end(),
        [](unsigned char c) { return !std::isspace(c); }));
    text.erase(std::find_if(text.rbegin(), text.rend(),
        [](unsigned char c) { return !std::isspace(c); }).base(), text.end());
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Result<void> remove_file(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Err<void, Error>(Error{ErrorKind::Filesystem,
            "cannot remove " + path.string() + ": " + ec.message()});
    }
    return Ok();
}

} // namespace

bool TerminalPrompt::confirm_overwrite(const std::string& name) {
    out_ << "File " << name << " already exists. Overwrite? [y/N]: " << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) {
        return false;
    }
    answer = lower_trimmed(answer);
    return answer == "y" || answer == "yes";
}

ConflictChoice TerminalPrompt::choose_conflict(const std::string& name,
                                               uint64_t final_size,
                                               uint64_t partial_size) {
    out_ << "Both " << name << " (" << final_size << " bytes) and " << name << kPartialSuffix
         << " (" << partial_size << " bytes) exist.\n"
         << "  1) keep " << name << " as complete, delete the partial file\n"
         << "  2) delete " << name << ", resume from the partial file\n"
         << "  3) delete both, download again from the start\n"
         << "  4) abort\n"
         << "Choice [4]: " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        return ConflictChoice::Abort;
    }
    answer = lower_trimmed(answer);
    if (answer == "1") return ConflictChoice::KeepFinal;
    if (answer == "2") return ConflictChoice::ResumePartial;
    if (answer == "3") return ConflictChoice::RestartFresh;
    return ConflictChoice::Abort;
}

ResumePlan reconcile(const fs::path& final_path,
                     const fs::path& partial_path,
                     bool force,
                     ConflictPrompt& prompt) {
    const auto final_size = regular_file_size(final_path);
    const auto partial_size = regular_file_size(partial_path);
    const std::string name = final_path.filename().string();

    ResumePlan plan;

    if (!final_size && !partial_size) {
        plan.action = ResumeAction::Fresh;
        return plan;
    }

    if (!final_size && partial_size) {
        plan.action = ResumeAction::Resume;
        plan.offset = *partial_size;
        return plan;
    }

    if (final_size && !partial_size) {
        if (force || prompt.confirm_overwrite(name)) {
            plan.action = ResumeAction::Fresh;
            plan.remove_final = true;
        } else {
            plan.action = ResumeAction::Abort;
        }
        return plan;
    }

    // Both present: an interrupted run left a partial next to a finished file.
    const ConflictChoice choice = force
        ? ConflictChoice::RestartFresh
        : prompt.choose_conflict(name, *final_size, *partial_size);

    switch (choice) {
        case ConflictChoice::KeepFinal:
            plan.action = ResumeAction::KeepExisting;
            plan.remove_partial = true;
            break;
        case ConflictChoice::ResumePartial:
            plan.action = ResumeAction::Resume;
            plan.offset = *partial_size;
            plan.remove_final = true;
            break;
        case ConflictChoice::RestartFresh:
            plan.action = ResumeAction::Fresh;
            plan.remove_final = true;
            plan.remove_partial = true;
            break;
        case ConflictChoice::Abort:
            plan.action = ResumeAction::Abort;
            break;
    }
    return plan;
}

Result<void> apply_plan(const ResumePlan& plan, const fs::path& final_path, const fs::path& partial_path) {
    if (plan.action == ResumeAction::Abort) {
        return Ok();
    }

    if (plan.remove_partial) {
        spdlog::info("Removing {}", partial_path.string());
        if (auto res = remove_file(partial_path); res.is_error()) {
            return res;
        }
    }
    if (plan.remove_final) {
        spdlog::info("Removing {}", final_path.string());
        if (auto res = remove_file(final_path); res.is_error()) {
            return res;
        }
    }
    return Ok();
}

} // namespace pushpop::transfer
