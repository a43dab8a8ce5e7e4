#include "ProblemReader.hpp"
#include "BoundaryErrors.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

using Entries = std::map<std::string, std::vector<double>>;

const std::vector<double>& values(const Entries& e, const std::string& key, std::size_t count) {
    auto it = e.find(key);
    if (it == e.end()) {
        throw InvalidInput(key + ": missing.");
    }
    if (it->second.size() != count) {
        throw InvalidInput(key + ": expected " + std::to_string(count) + " value(s), got "
                           + std::to_string(it->second.size()) + ".");
    }
    return it->second;
}

}

double parse_real(const std::string& key, const std::string& token) {
    std::size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(token, &pos);
    } catch (const std::invalid_argument&) {
        throw InvalidInput(key + ": '" + token + "' is not a number.");
    } catch (const std::out_of_range&) {
        throw InvalidInput(key + ": '" + token + "' is out of range.");
    }
    if (pos != token.size()) {
        throw InvalidInput(key + ": '" + token + "' is not a number.");
    }
    return v;
}

namespace {

int to_integer(const std::string& key, double v) {
    if (!std::isfinite(v) || std::floor(v) != v
        || v > std::numeric_limits<int>::max() || v < std::numeric_limits<int>::min()) {
        throw InvalidInput(key + ": must be an integer.");
    }
    return static_cast<int>(v);
}

}

int parse_integer(const std::string& key, const std::string& token) {
    return to_integer(key, parse_real(key, token));
}

BoundaryProblem parse_problem(std::istream& in) {
    static const char* known[] = {"dimension", "scale", "critical_value", "target", "covariance",
                                  "initial_guess", "max_iterations", "tolerance"};
    Entries entries;
    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream ls(line);
        std::string key;
        if (!(ls >> key)) continue;

        bool is_known = false;
        for (const char* k : known) is_known = is_known || key == k;
        if (!is_known) {
            throw InvalidInput(key + ": unknown key.");
        }
        if (entries.count(key)) {
            throw InvalidInput(key + ": given more than once.");
        }

        std::vector<double>& vals = entries[key];
        std::string token;
        while (ls >> token) vals.push_back(parse_real(key, token));
    }

    BoundaryProblem p;
    p.dimension = to_integer("dimension", values(entries, "dimension", 1)[0]);
    if (p.dimension < 1) {
        throw InvalidInput("dimension: must be a positive integer.");
    }
    const int n = p.dimension;
    const auto nn = static_cast<std::size_t>(n);

    p.scale = values(entries, "scale", 1)[0];
    p.critical_value = values(entries, "critical_value", 1)[0];

    const auto& d = values(entries, "target", nn);
    p.target = Eigen::Map<const Eigen::VectorXd>(d.data(), n);

    const auto& v = values(entries, "covariance", nn * nn);
    p.covariance = Eigen::Map<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(v.data(), n, n);

    if (entries.count("initial_guess")) {
        const auto& y = values(entries, "initial_guess", nn + 1);
        p.initial_guess = Eigen::Map<const Eigen::VectorXd>(y.data(), n + 1);
    } else {
        p.initial_guess = Eigen::VectorXd::Ones(n + 1);
    }
    if (entries.count("max_iterations")) {
        p.max_iterations = to_integer("max_iterations", values(entries, "max_iterations", 1)[0]);
    }
    if (entries.count("tolerance")) {
        p.tolerance = values(entries, "tolerance", 1)[0];
    }

    validate_problem(p);
    return p;
}

BoundaryProblem read_problem(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("read_problem: could not open " + path + ".");
    }
    return parse_problem(ifs);
}
