#include "OutputWriter.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>

namespace outputWriter {
    WriteError::WriteError(const std::string &path, const std::string &reason) :
            std::runtime_error(
                    "Could not save file: " + path + " (" + reason + ")\n"
                    "Possible causes:\n"
                    "  - File is currently open in Excel or another application\n"
                    "  - Insufficient write permissions in the directory\n"
                    "  - File is marked as read-only\n"
                    "Solutions:\n"
                    "  - Close the file in any applications and try again\n"
                    "  - Check the permissions of the file and directory\n"
                    "  - Choose a different output directory"
            ),
            path_(path) {}

    const std::string &WriteError::path() const {
        return path_;
    }

    std::string csvField(const std::string &text) {
        if (text.find_first_of(",\"\r\n") == std::string::npos) {
            return text;
        }
        std::string quoted = "\"";
        for (char c : text) {
            if (c == '"') {
                quoted += '"';
            }
            quoted += c;
        }
        return quoted + '"';
    }

    std::string header(const std::string &dateColumn) {
        return dateColumn + ",Open,High,Low,Close,Volume";
    }

    std::string formatRow(const bar::Bar &row) {
        std::ostringstream os;
        os.precision(std::numeric_limits<double>::digits10);
        os << csvField(row.timestamp) << ','
           << row.open << ','
           << row.high << ','
           << row.low << ','
           << row.close << ','
           << row.volume;
        return os.str();
    }

    void writeCsv(
            const std::string &path,
            const std::string &dateColumn,
            const std::vector<bar::Bar> &rows
    ) {
        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file) {
            throw WriteError(path, std::strerror(errno));
        }

        file << header(dateColumn) << '\n';
        for (const bar::Bar &row : rows) {
            file << formatRow(row) << '\n';
        }

        file.close();
        if (!file) {
            throw WriteError(path, "write failed");
        }
    }
}
