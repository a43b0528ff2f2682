#include "FileConflictResolver.h"

#include <cstdio>
#include <ctime>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/c_local_time_adjustor.hpp>
#include <boost/filesystem.hpp>
#include <spdlog/spdlog.h>

namespace fs = boost::filesystem;

namespace fileConflict {
    namespace {
        std::string lastModified(const std::string &path) {
            boost::system::error_code ec;
            std::time_t modified = fs::last_write_time(path, ec);
            if (ec) {
                return "unknown";
            }
            return timeUtils::timeStringFormatter(
                    "%Y-%m-%d %H:%M:%S",
                    boost::date_time::c_local_adjustor<timeUtils::ptime>
                    ::utc_to_local(timeUtils::from_time_t(modified))
            );
        }

        std::string withSuffix(const fs::path &path, const std::string &suffix) {
            fs::path renamed = path.parent_path() /
                               (path.stem().string() + suffix +
                                path.extension().string());
            return renamed.string();
        }
    }

    Action AutoOverwrite::decide(const std::string &path) {
        return Action::Overwrite;
    }

    Action AutoRename::decide(const std::string &path) {
        return Action::Rename;
    }

    Action AutoCancel::decide(const std::string &path) {
        return Action::Cancel;
    }

    Interactive::Interactive(PromptFn prompt, std::ostream &out) :
            prompt_(std::move(prompt)), out_(out) {}

    Action Interactive::decide(const std::string &path) {
        out_ << "\nFile conflict detected!\n"
             << "Output file '" << path << "' already exists (modified: "
             << lastModified(path) << ")\n"
             << "Full path: " << fs::absolute(path).string() << "\n\n"
             << "Choose action:\n"
             << "  [O]verwrite - Replace the existing file\n"
             << "  [R]ename    - Create new file with timestamp suffix\n"
             << "  [C]ancel    - Abort the operation\n"
             << std::endl;

        while (true) {
            boost::optional<std::string> answer =
                    prompt_("Enter choice [O/R/C]: ");
            if (!answer) {
                return Action::Cancel;
            }

            std::string choice = boost::algorithm::to_upper_copy(
                    boost::algorithm::trim_copy(*answer)
            );
            if (choice == "O" || choice == "OVERWRITE") {
                return Action::Overwrite;
            } else if (choice == "R" || choice == "RENAME") {
                return Action::Rename;
            } else if (choice == "C" || choice == "CANCEL") {
                return Action::Cancel;
            }
            out_ << "Invalid choice. Please enter O, R, or C." << std::endl;
        }
    }

    Interactive::PromptFn Interactive::streamPrompt(
            std::istream &in,
            std::ostream &out
    ) {
        return [&in, &out](const std::string &prompt)
                -> boost::optional<std::string> {
            out << prompt << std::flush;
            std::string line;
            if (!std::getline(in, line)) {
                return boost::none;
            }
            return line;
        };
    }

    std::unique_ptr<ConflictPolicy> makePolicy(const std::string &name) {
        if (name == "prompt") {
            return std::unique_ptr<ConflictPolicy>(
                    new Interactive(Interactive::streamPrompt())
            );
        } else if (name == "overwrite") {
            return std::unique_ptr<ConflictPolicy>(new AutoOverwrite());
        } else if (name == "rename") {
            return std::unique_ptr<ConflictPolicy>(new AutoRename());
        } else if (name == "cancel") {
            return std::unique_ptr<ConflictPolicy>(new AutoCancel());
        }
        throw std::invalid_argument(
                "Unknown conflict policy '" + name +
                "'. Choose from prompt, overwrite, rename, cancel."
        );
    }

    std::string renamedPath(
            const std::string &path,
            const timeUtils::ptime &now
    ) {
        std::string stamp = "_" + timeUtils::timeStringFormatter(
                "%Y%m%d_%H%M%S", now
        );

        std::string candidate = withSuffix(path, stamp);
        for (int counter = 1; fs::exists(candidate); ++counter) {
            char tiebreak[16];
            std::snprintf(tiebreak, sizeof(tiebreak), "_%02d", counter);
            candidate = withSuffix(path, stamp + tiebreak);
        }
        return candidate;
    }

    Resolution resolve(
            const std::string &path,
            bool overwrite,
            ConflictPolicy &policy,
            const timeUtils::ptime &now
    ) {
        if (!fs::exists(path)) {
            return Resolution{path, true, Action::Create};
        }

        if (overwrite) {
            spdlog::info("Overwriting existing file: {}", path);
            return Resolution{path, true, Action::Overwrite};
        }

        switch (policy.decide(path)) {
            case Action::Overwrite:
                spdlog::info("Overwriting: {}", path);
                return Resolution{path, true, Action::Overwrite};
            case Action::Rename: {
                std::string renamed = renamedPath(path, now);
                spdlog::info("Creating new file: {}", renamed);
                return Resolution{renamed, true, Action::Rename};
            }
            case Action::Create:
            case Action::Cancel:
                break;
        }
        spdlog::info("Operation cancelled by user.");
        return Resolution{path, false, Action::Cancel};
    }
}
