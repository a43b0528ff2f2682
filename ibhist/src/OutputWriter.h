#ifndef IBHIST_OUTPUTWRITER_H
#define IBHIST_OUTPUTWRITER_H

#include <stdexcept>
#include <string>
#include <vector>

#include "dataStructs/bar.h"

namespace outputWriter {
    class WriteError : public std::runtime_error {
    public:
        WriteError(const std::string &path, const std::string &reason);

        const std::string &path() const;

    private:
        std::string path_;
    };

    /**
     * Quotes a field that holds a separator, a quote or a line break, with
     * embedded quotes doubled.
     */
    std::string csvField(const std::string &text);

    /** "<dateColumn>,Open,High,Low,Close,Volume" */
    std::string header(const std::string &dateColumn);

    std::string formatRow(const bar::Bar &row);

    /**
     * Writes the rows as CSV in a single pass, replacing any existing
     * file.
     *
     * @throws WriteError if the file cannot be opened or written. The
     *     message lists the usual causes.
     */
    void writeCsv(
            const std::string &path,
            const std::string &dateColumn,
            const std::vector<bar::Bar> &rows
    );
}

#endif //IBHIST_OUTPUTWRITER_H
