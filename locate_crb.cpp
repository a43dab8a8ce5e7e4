#include "BoundaryErrors.hpp"
#include "BoundaryLocator.hpp"
#include "ConfidenceRegion.hpp"
#include "ProblemReader.hpp"

#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

static void print_vector(const char* label, const Eigen::VectorXd& v) {
    std::cout << label;
    for (int i = 0; i < v.size(); ++i) std::cout << (i ? " " : "") << v[i];
    std::cout << "\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <problem-file> [max_iterations] [tolerance] [--slsqp]\n";
        return 2;
    }

    std::cout.setf(std::ios::fixed);
    std::cout.precision(9);

    SolverKind solver = SolverKind::NewtonRaphson;
    int positional = 0;
    try {
        BoundaryProblem p = read_problem(argv[1]);

        // Positional overrides: ./locate_crb problem.txt 200 1e-10
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--slsqp") == 0) {
                solver = SolverKind::SLSQP;
            } else if (positional == 0) {
                p.max_iterations = parse_integer("max_iterations", argv[i]);
                ++positional;
            } else if (positional == 1) {
                p.tolerance = parse_real("tolerance", argv[i]);
                ++positional;
            } else {
                std::cerr << "Error: unexpected argument " << argv[i] << "\n";
                return 2;
            }
        }

        const auto started = std::chrono::steady_clock::now();
        const BoundarySolution sol = locate_verified_boundary(p, solver);
        const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;

        const ConfidenceRegion crb = ConfidenceRegion::from_problem(p);
        const Eigen::VectorXd t = sol.location();

        std::cout << "solver:          " << solver_name(solver) << "\n";
        print_vector("point:           ", t);
        std::cout << "lambda:          " << sol.lambda() << "\n";
        print_vector("opposite point:  ", crb.opposite_point(t));
        std::cout << "converged:       " << (sol.converged ? "yes" : "no") << "\n";
        std::cout << "iterations:      " << sol.iterations << " / " << sol.max_iterations << "\n";
        std::cout << "on boundary:     " << (sol.on_boundary.value_or(false) ? "yes" : "no") << "\n";
        std::cout << "kdvd:            " << crb.kdvd(t) << " (critical value " << p.critical_value << ")\n";
        std::cout << "msd(target):     " << crb.msd(p.target) << "\n";
        std::cout << "msd(point):      " << crb.msd(t) << "\n";
        std::cout << "time_ms:         " << elapsed.count() << "\n";
        return sol.on_boundary.value_or(false) ? 0 : 1;
    } catch (const InvalidInput& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
    } catch (const SingularMatrix& e) {
        std::cerr << "Singular matrix: " << e.what() << "\n";
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 2;
}
