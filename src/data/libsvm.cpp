#include "libsvm.h"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace lassolab {

namespace {

[[noreturn]] void parse_error(int line_no, const std::string& what) {
    throw std::runtime_error("LibSVM parse error at line " + std::to_string(line_no) + ": " + what);
}

double parse_double(const std::string& token, int line_no) {
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        parse_error(line_no, "invalid number '" + token + "'");
    }
    return v;
}

long parse_index(const std::string& token, int line_no) {
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        parse_error(line_no, "invalid feature index '" + token + "'");
    }
    if (v < 1) {
        parse_error(line_no, "feature indices are 1-based, got " + token);
    }
    if (v > std::numeric_limits<int>::max()) {
        parse_error(line_no, "feature index " + token + " is too large");
    }
    return v;
}

} // namespace

LibSVMData read_libsvm(std::istream& in, int n_features) {
    std::vector<int> rows;
    std::vector<int> cols;
    std::vector<double> values;
    std::vector<double> labels;

    long max_index = 0;
    int line_no = 0;
    std::string line;

    while (std::getline(in, line)) {
        ++line_no;
        std::string::size_type hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream tokens(line);
        std::string token;
        if (!(tokens >> token)) continue;  // blank

        const int row = static_cast<int>(labels.size());
        labels.push_back(parse_double(token, line_no));

        while (tokens >> token) {
            std::string::size_type colon = token.find(':');
            if (colon == std::string::npos) {
                parse_error(line_no, "expected index:value, got '" + token + "'");
            }
            long index = parse_index(token.substr(0, colon), line_no);
            double value = parse_double(token.substr(colon + 1), line_no);
            if (n_features > 0 && index > n_features) {
                parse_error(line_no, "feature index " + std::to_string(index) +
                                     " exceeds n_features " + std::to_string(n_features));
            }
            if (index > max_index) max_index = index;
            rows.push_back(row);
            cols.push_back(static_cast<int>(index - 1));
            values.push_back(value);
        }
    }
    if (in.bad()) {
        throw std::runtime_error("LibSVM read failed after line " + std::to_string(line_no));
    }

    const int n = static_cast<int>(labels.size());
    const int d = n_features > 0 ? n_features : static_cast<int>(max_index);

    LibSVMData data;
    data.X = SparseDesignMatrix::from_triplets(rows, cols, values, n, d);
    data.y = Eigen::Map<const Eigen::VectorXd>(labels.data(), n);
    return data;
}

LibSVMData load_libsvm(const std::string& path, int n_features) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open LibSVM file: " + path);
    }
    return read_libsvm(file, n_features);
}

} // namespace lassolab
