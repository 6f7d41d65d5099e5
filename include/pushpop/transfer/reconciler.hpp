#pragma once

#include "pushpop/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace pushpop::transfer {

/// Suffix of the on-disk partial download.
constexpr const char* kPartialSuffix = ".part";

inline std::filesystem::path partial_path_for(const std::filesystem::path& final_path) {
    return std::filesystem::path(final_path.string() + kPartialSuffix);
}

/**
 * @brief Answers when both the final and the partial file exist
 */
enum class ConflictChoice {
    KeepFinal,        // 1: final is complete, discard partial
    ResumePartial,    // 2: discard final, resume from partial length
    RestartFresh,     // 3: discard both, start at 0
    Abort             // 4: touch nothing
};

/**
 * @brief Source of destructive-choice answers
 *
 * The terminal implementation asks the user; tests and unattended runs
 * use ScriptedPrompt.
 */
class ConflictPrompt {
public:
    virtual ~ConflictPrompt() = default;

    /// Final file exists, no partial: may it be overwritten?
    virtual bool confirm_overwrite(const std::string& name) = 0;

    /// Both exist: which of the four resolutions?
    virtual ConflictChoice choose_conflict(const std::string& name,
                                           uint64_t final_size,
                                           uint64_t partial_size) = 0;
};

/**
 * @brief Interactive prompt on an input/output stream pair (stdin/stdout)
 *
 * Anything other than an explicit yes / a valid choice number is treated
 * as a refusal or Abort.
 */
class TerminalPrompt : public ConflictPrompt {
public:
    TerminalPrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool confirm_overwrite(const std::string& name) override;
    ConflictChoice choose_conflict(const std::string& name,
                                   uint64_t final_size,
                                   uint64_t partial_size) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

/**
 * @brief Fixed answers; the defaults are the safe ones (no, Abort)
 */
class ScriptedPrompt : public ConflictPrompt {
public:
    explicit ScriptedPrompt(bool overwrite = false, ConflictChoice choice = ConflictChoice::Abort)
        : overwrite_(overwrite), choice_(choice) {}

    bool confirm_overwrite(const std::string&) override {
        ++overwrite_questions_;
        return overwrite_;
    }

    ConflictChoice choose_conflict(const std::string&, uint64_t, uint64_t) override {
        ++conflict_questions_;
        return choice_;
    }

    int overwrite_questions() const { return overwrite_questions_; }
    int conflict_questions() const { return conflict_questions_; }

private:
    bool overwrite_;
    ConflictChoice choice_;
    int overwrite_questions_ = 0;
    int conflict_questions_ = 0;
};

enum class ResumeAction {
    Fresh,         // download from offset 0
    Resume,        // append to the partial file from its length
    KeepExisting,  // final file is kept as complete; nothing to download
    Abort          // user declined; no side effects
};

/**
 * @brief Outcome of reconcile(); side effects are described, not performed
 */
struct ResumePlan {
    ResumeAction action = ResumeAction::Fresh;
    uint64_t offset = 0;
    bool remove_final = false;
    bool remove_partial = false;
};

/**
 * @brief Decide where a download starts, given what is already on disk
 *
 * | final | partial | result                                            |
 * |-------|---------|---------------------------------------------------|
 * | no    | no      | Fresh at 0                                        |
 * | no    | yes     | Resume at partial length                          |
 * | yes   | no      | ask to overwrite (force: yes); no -> Abort        |
 * | yes   | yes     | ask for one of four choices (force: RestartFresh) |
 *
 * Only inspects the file system and consults @p prompt.
 */
ResumePlan reconcile(const std::filesystem::path& final_path,
                     const std::filesystem::path& partial_path,
                     bool force,
                     ConflictPrompt& prompt);

/**
 * @brief Perform the deletions a plan calls for
 *
 * Abort performs none. Failures are ErrorKind::Filesystem.
 */
Result<void> apply_plan(const ResumePlan& plan,
                        const std::filesystem::path& final_path,
                        const std::filesystem::path& partial_path);

} // namespace pushpop::transfer
