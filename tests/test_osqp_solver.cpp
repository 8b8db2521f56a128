#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "optimizer/mean_variance_optimizer.hpp"
#include "optimizer/osqp_solver.hpp"
#include <cmath>
#include <limits>

using namespace cemv;
using namespace cemv::optimizer;
using Catch::Matchers::WithinAbs;

namespace {

QuadraticProblem simplex_problem(const Eigen::VectorXd &q) {
    const Eigen::Index n = q.size();
    QuadraticProblem problem;
    problem.P = 2.0 * Eigen::MatrixXd::Identity(n, n);
    problem.q = q;
    problem.A_eq = Eigen::MatrixXd::Ones(1, n);
    problem.b_eq = Eigen::VectorXd::Ones(1);
    problem.lower_bounds = Eigen::VectorXd::Zero(n);
    problem.upper_bounds = Eigen::VectorXd::Ones(n);
    return problem;
}

} // namespace

TEST_CASE("OSQP equality and bound constraints", "[OSQP][Critical]") {
    OSQPSolver solver;
    REQUIRE(solver.get_name() == "OSQP");

    SECTION("Symmetric problem lands on the simplex center") {
        // min x'x  s.t.  sum(x) = 1, 0 <= x <= 1
        auto result = solver.solve(simplex_problem(Eigen::VectorXd::Zero(3)));

        REQUIRE(result.success);
        REQUIRE(result.message == "solved");
        REQUIRE_THAT(result.solution.sum(), WithinAbs(1.0, 1e-5));
        for (Eigen::Index i = 0; i < 3; ++i) {
            REQUIRE_THAT(result.solution(i), WithinAbs(1.0 / 3.0, 1e-4));
        }
    }

    SECTION("Strong linear term pushes to a vertex") {
        Eigen::VectorXd q(3);
        q << -10.0, 0.0, 0.0;
        auto result = solver.solve(simplex_problem(q));

        REQUIRE(result.success);
        REQUIRE_THAT(result.solution(0), WithinAbs(1.0, 1e-4));
        REQUIRE_THAT(result.solution(1), WithinAbs(0.0, 1e-4));
    }
}

TEST_CASE("OSQP failure is a result, not an exception", "[OSQP]") {
    OSQPSolver solver;

    SECTION("Non-finite problem data") {
        auto problem = simplex_problem(Eigen::VectorXd::Zero(2));
        problem.q(0) = std::numeric_limits<double>::quiet_NaN();

        auto result = solver.solve(problem);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Non-finite problem data");
    }

    SECTION("Infeasible bounds") {
        auto problem = simplex_problem(Eigen::VectorXd::Zero(2));
        problem.upper_bounds = Eigen::VectorXd::Constant(2, 0.2);

        auto result = solver.solve(problem);
        REQUIRE_FALSE(result.success);
    }

    SECTION("Malformed problem is a contract violation") {
        auto problem = simplex_problem(Eigen::VectorXd::Zero(3));
        problem.lower_bounds = Eigen::VectorXd::Zero(2);
        REQUIRE_THROWS_AS(solver.solve(problem), std::invalid_argument);
    }
}

TEST_CASE("Solver options", "[OSQP]") {
    SECTION("Defaults") {
        SolverOptions options;
        REQUIRE(options.max_iterations == 10000);
        REQUIRE_THAT(options.tolerance, WithinAbs(1e-6, 1e-18));
        REQUIRE_NOTHROW(options.validate());
    }

    SECTION("From JSON") {
        auto options = SolverOptions::from_json({{"max_iterations", 200}, {"accept_inaccurate", true}});
        REQUIRE(options.max_iterations == 200);
        REQUIRE(options.accept_inaccurate);
    }

    SECTION("Validation") {
        SolverOptions options;
        options.tolerance = 0.0;
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
        options = SolverOptions();
        options.time_limit = -1.0;
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
    }

    SECTION("Options reach the backend") {
        SolverOptions options;
        options.max_iterations = 1;
        OSQPSolver solver(options);
        REQUIRE(solver.get_options().max_iterations == 1);

        Eigen::VectorXd q(3);
        q << -0.3, 0.1, 0.05;
        auto result = solver.solve(simplex_problem(q));
        REQUIRE(result.iterations <= 1);
    }
}

TEST_CASE("Mean-variance QP", "[OSQP][MeanVariance]") {
    Eigen::VectorXd mu(3);
    mu << 0.01, 0.02, 0.03;
    Eigen::MatrixXd cov = Eigen::MatrixXd::Identity(3, 3);

    MeanVarianceOptimizer optimizer(0.01);

    SECTION("Problem layout") {
        auto problem = optimizer.build_problem(mu, cov);
        REQUIRE(problem.P.isApprox(0.02 * cov));
        REQUIRE(problem.q.isApprox(-mu));
        REQUIRE(problem.A_eq.rows() == 1);
        REQUIRE(problem.upper_bounds.isApprox(Eigen::VectorXd::Ones(3)));
    }

    SECTION("Solution is long-only and fully invested") {
        auto result = optimizer.optimize(mu, cov);
        REQUIRE(result.success);
        REQUIRE(result.is_valid());
        REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-9));
        REQUIRE(result.weights.minCoeff() >= 0.0);
        REQUIRE(result.weights(2) >= result.weights(1));
        REQUIRE(result.weights(1) >= result.weights(0));
    }

    SECTION("Dimension mismatch") {
        REQUIRE_THROWS_AS(optimizer.optimize(mu, Eigen::MatrixXd::Identity(2, 2)), std::invalid_argument);
    }

    SECTION("Risk aversion must be positive") {
        REQUIRE_THROWS_AS(MeanVarianceOptimizer(0.0), std::invalid_argument);
    }
}
