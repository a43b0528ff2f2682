#ifndef IBHIST_FILECONFLICTRESOLVER_H
#define IBHIST_FILECONFLICTRESOLVER_H

#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "utils/timeUtils.h"

namespace fileConflict {
    enum class Action {
        Create,
        Overwrite,
        Rename,
        Cancel
    };

    struct Resolution {
        std::string path;
        bool proceed;
        Action action;
    };

    /**
     * Decides what to do when the output file already exists.
     */
    class ConflictPolicy {
    public:
        virtual ~ConflictPolicy() = default;

        /**
         * @param path The existing file.
         * @return Overwrite, Rename or Cancel.
         */
        virtual Action decide(const std::string &path) = 0;
    };

    class AutoOverwrite : public ConflictPolicy {
    public:
        Action decide(const std::string &path) override;
    };

    class AutoRename : public ConflictPolicy {
    public:
        Action decide(const std::string &path) override;
    };

    class AutoCancel : public ConflictPolicy {
    public:
        Action decide(const std::string &path) override;
    };

    /**
     * Asks the user. Answers are O/OVERWRITE, R/RENAME or C/CANCEL in any
     * case; anything else is asked again. Running out of input cancels.
     */
    class Interactive : public ConflictPolicy {
    public:
        /** Shows the prompt and returns the answer, or none at end of input. */
        using PromptFn =
        std::function<boost::optional<std::string>(const std::string &)>;

        explicit Interactive(PromptFn prompt, std::ostream &out = std::cout);

        Action decide(const std::string &path) override;

        /** Prompts on `out` and reads one line from `in`. */
        static PromptFn streamPrompt(
                std::istream &in = std::cin,
                std::ostream &out = std::cout
        );

    private:
        PromptFn prompt_;
        std::ostream &out_;
    };

    /**
     * Policy for the --on-conflict setting: "prompt", "overwrite", "rename"
     * or "cancel".
     *
     * @throws std::invalid_argument for any other name.
     */
    std::unique_ptr<ConflictPolicy> makePolicy(const std::string &name);

    /**
     * First free path of the form basename_YYYYMMDD_HHMMSS.ext, then
     * basename_YYYYMMDD_HHMMSS_01.ext, _02 and so on.
     */
    std::string renamedPath(
            const std::string &path,
            const timeUtils::ptime &now
    );

    /**
     * Picks the path to write to.
     *
     * @param path The intended output file.
     * @param overwrite If `true`, an existing file is replaced without
     *     asking the policy.
     * @param policy Consulted only when the file exists and overwrite is
     *     off.
     * @param now Local time used for renamed files.
     * @return The final path and whether writing should go ahead.
     */
    Resolution resolve(
            const std::string &path,
            bool overwrite,
            ConflictPolicy &policy,
            const timeUtils::ptime &now =
                    timeUtils::second_clock::local_time()
    );
}

#endif //IBHIST_FILECONFLICTRESOLVER_H
