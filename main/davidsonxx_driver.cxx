/*
 * davidsonxx Copyright (c) 2023, The Regents of the University of California,
 * through Lawrence Berkeley National Laboratory (subject to receipt of
 * any required approvals from the U.S. Dept. of Energy). All rights reserved.
 *
 * See LICENSE.txt for details
 */

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/program_options.hpp>
#include <cctype>
#include <davidsonxx/davidsonxx_config.hpp>
#include <davidsonxx/model/model_problems.hpp>
#include <davidsonxx/solvers/davidson.hpp>
#include <davidsonxx/solvers/guess.hpp>
#include <davidsonxx/solvers/mixed_precision.hpp>
#include <davidsonxx/sparse_operator.hpp>
#include <iostream>
#include <map>
#include <sparsexx/matrix_types/dense_conversions.hpp>

#ifdef DAVIDSONXX_ENABLE_OPENMP
#include <omp.h>
#endif

namespace po = boost::program_options;

enum class Problem { Diagonal, Random, Dominant, Laplacian };
enum class OperatorKind { Dense, Sparse, MatrixFree };
enum class Precision { Half, Single, Double, LongDouble, ComplexDouble };

std::map<std::string, Problem> problem_map = {
    {"DIAGONAL", Problem::Diagonal},
    {"RANDOM", Problem::Random},
    {"DOMINANT", Problem::Dominant},
    {"LAPLACIAN", Problem::Laplacian}};

std::map<std::string, OperatorKind> operator_map = {
    {"DENSE", OperatorKind::Dense},
    {"SPARSE", OperatorKind::Sparse},
    {"MATRIX_FREE", OperatorKind::MatrixFree}};

std::map<std::string, Precision> precision_map = {
    {"HALF", Precision::Half},
    {"SINGLE", Precision::Single},
    {"DOUBLE", Precision::Double},
    {"LONG_DOUBLE", Precision::LongDouble},
    {"COMPLEX_DOUBLE", Precision::ComplexDouble}};

struct DriverConfig {
  Problem problem;
  OperatorKind op;
  Precision precision;
  int64_t n;
  int64_t nev;
  int64_t m0;
  uint64_t seed;
  bool diag_precond;
  bool refine;
  davidsonxx::DavidsonSettings settings;
};

template <typename MapType>
auto lookup(const MapType& map, std::string key, const std::string& what) {
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  auto it = map.find(key);
  if(it == map.end()) throw std::runtime_error("Unknown " + what + ": " + key);
  return it->second;
}

std::vector<double> build_problem(const DriverConfig& conf) {
  switch(conf.problem) {
    case Problem::Diagonal: {
      std::vector<double> D(conf.n);
      for(int64_t i = 0; i < conf.n; ++i) D[i] = double(i + 1);
      return davidsonxx::diagonal_matrix(D);
    }
    case Problem::Random:
      return davidsonxx::random_symmetric_matrix(conf.n, conf.seed);
    case Problem::Dominant:
      return davidsonxx::diagonally_dominant_matrix(conf.n, 1e-2, conf.seed);
    default: {
      std::vector<double> A(conf.n * conf.n, 0.);
      sparsexx::convert_to_dense(davidsonxx::laplacian_1d(conf.n), A.data(),
                                 conf.n);
      return A;
    }
  }
}

template <typename T, typename Op>
davidsonxx::davidson_result<T> solve(const DriverConfig& conf, const Op& op,
                                     const std::vector<T>& D) {
  auto X0 = davidsonxx::random_orthonormal_guess<T>(conf.n, conf.m0, conf.seed);
  if(conf.diag_precond)
    return davidsonxx::block_davidson(conf.settings, op,
                                      davidsonxx::DiagonalPreconditioner<T>(D),
                                      conf.m0, conf.nev, X0.data(), conf.n);
  else
    return davidsonxx::block_davidson(conf.settings, op, conf.m0, conf.nev,
                                      X0.data(), conf.n);
}

/// Loose single precision solve, refined with op in precision T
template <typename T, typename Op>
davidsonxx::davidson_result<T> refine(const DriverConfig& conf, const Op& op,
                                      const std::vector<T>& D,
                                      const std::vector<double>& A_d) {
  auto A_s = davidsonxx::cast_matrix<float>(A_d);
  davidsonxx::DenseMatrixOperator<float> single_op(conf.n, A_s);
  auto loose_conf = conf;
  loose_conf.settings.res_tol = 1e-3;
  auto loose =
      solve(loose_conf, single_op, davidsonxx::extract_diagonal(single_op));

  if(conf.diag_precond)
    return davidsonxx::davidson_refine(
        conf.settings, op, davidsonxx::DiagonalPreconditioner<T>(D), loose);
  else
    return davidsonxx::davidson_refine(conf.settings, op, loose);
}

template <typename T, typename Op>
davidsonxx::davidson_result<T> solve_or_refine(
    const DriverConfig& conf, const Op& op, const std::vector<T>& D,
    const std::vector<double>& A_d) {
  if(conf.refine) return refine(conf, op, D, A_d);
  return solve(conf, op, D);
}

template <typename T>
davidsonxx::davidson_result<T> run(const DriverConfig& conf,
                                   const std::vector<double>& A_d) {
  auto A = davidsonxx::cast_matrix<T>(A_d);
  davidsonxx::DenseMatrixOperator<T> dense_op(conf.n, A);
  auto D = davidsonxx::extract_diagonal(dense_op);

  switch(conf.op) {
    case OperatorKind::MatrixFree: {
      davidsonxx::MatrixFreeOperator<T> mf_op(
          conf.n, [&](int64_t, int64_t K, const T* V, int64_t LDV, T* AV,
                      int64_t LDAV) {
            dense_op.operator_action(K, T(1), V, LDV, T(0), AV, LDAV);
          });
      return solve_or_refine(conf, mf_op, D, A_d);
    }
    case OperatorKind::Sparse: {
      if constexpr(std::is_same_v<T, double>) {
        auto A_sp = davidsonxx::dense_to_csr(conf.n, A_d);
        davidsonxx::SparseMatrixOperator sp_op(A_sp);
        return solve_or_refine(conf, sp_op, D, A_d);
      } else {
        throw std::runtime_error(
            "Sparse Operators Are Only Available In Double Precision");
      }
    }
    default:
      return solve_or_refine(conf, dense_op, D, A_d);
  }
}

template <typename T>
void report(const davidsonxx::davidson_result<T>& result) {
  auto console = spdlog::get("davidsonxx_driver");
  console->info("Converged in {} iterations, RNORM = {:.6e}",
                result.iterations,
                davidsonxx::detail::convert<double>(result.residual_norm));
  for(int64_t i = 0; i < result.nev; ++i)
    console->info("  LAM({:3}) = {:.15e}", i,
                  davidsonxx::detail::convert<double>(result.eigenvalues[i]));
}

template <typename T>
void run_and_report(const DriverConfig& conf, const std::vector<double>& A) {
  report(run<T>(conf, A));
}

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();
  spdlog::set_pattern("[%n] %v");
  auto console = spdlog::stdout_color_mt("davidsonxx_driver");

  po::options_description desc("davidsonxx driver options");
  // clang-format off
  desc.add_options()
    ("help,h",       "Print this message")
    ("problem",      po::value<std::string>()->default_value("random"),
                     "Model problem: diagonal, random, dominant, laplacian")
    ("operator",     po::value<std::string>()->default_value("dense"),
                     "Operator: dense, sparse, matrix_free")
    ("precision",    po::value<std::string>()->default_value("double"),
                     "Scalar type: half, single, double, long_double, "
                     "complex_double")
    ("n",            po::value<int64_t>()->default_value(100),
                     "Problem dimension")
    ("nev",          po::value<int64_t>()->default_value(2),
                     "Number of eigenpairs")
    ("m0",           po::value<int64_t>(),
                     "Width of the initial guess (default: NEV)")
    ("max_iter",     po::value<size_t>()->default_value(100),
                     "Maximum number of iterations")
    ("res_tol",      po::value<double>(),
                     "Residual tolerance (default: 20 * N * eps)")
    ("max_subspace", po::value<size_t>(),
                     "Maximum search space dimension (default: 8 * M0)")
    ("precond",      po::value<std::string>()->default_value("none"),
                     "Preconditioner: none, diagonal")
    ("seed",         po::value<uint64_t>()->default_value(0),
                     "Seed for random problems and guesses")
    ("refine",       po::bool_switch()->default_value(false),
                     "Solve loosely in single precision first");
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch(const po::error& e) {
    console->error("{}", e.what());
    std::cerr << desc << std::endl;
    return 1;
  }

  if(vm.count("help")) {
    std::cout << desc << std::endl;
    return 0;
  }

  try {
    DriverConfig conf;
    conf.problem =
        lookup(problem_map, vm["problem"].as<std::string>(), "Problem");
    conf.op = lookup(operator_map, vm["operator"].as<std::string>(),
                     "Operator");
    conf.precision =
        lookup(precision_map, vm["precision"].as<std::string>(), "Precision");
    conf.n = vm["n"].as<int64_t>();
    conf.nev = vm["nev"].as<int64_t>();
    conf.m0 = vm.count("m0") ? vm["m0"].as<int64_t>() : conf.nev;
    conf.seed = vm["seed"].as<uint64_t>();
    conf.refine = vm["refine"].as<bool>();

    auto precond = vm["precond"].as<std::string>();
    if(precond != "none" and precond != "diagonal")
      throw std::runtime_error("Unknown Preconditioner: " + precond);
    conf.diag_precond = precond == "diagonal";

    conf.settings.max_iter = vm["max_iter"].as<size_t>();
    if(vm.count("res_tol")) conf.settings.res_tol = vm["res_tol"].as<double>();
    if(vm.count("max_subspace"))
      conf.settings.max_subspace = vm["max_subspace"].as<size_t>();

    console->info("davidsonxx v{}", DAVIDSONXX_VERSION_STRING);
#ifdef DAVIDSONXX_ENABLE_OPENMP
    console->info("  OMP_NUM_THREADS = {}", omp_get_max_threads());
#endif
    console->info("  PROBLEM = {}, OPERATOR = {}, PRECISION = {}",
                  vm["problem"].as<std::string>(),
                  vm["operator"].as<std::string>(),
                  vm["precision"].as<std::string>());

    const auto A = build_problem(conf);

    switch(conf.precision) {
      case Precision::Half:
        run_and_report<Eigen::half>(conf, A);
        break;
      case Precision::Single:
        run_and_report<float>(conf, A);
        break;
      case Precision::LongDouble:
        run_and_report<long double>(conf, A);
        break;
      case Precision::ComplexDouble:
        run_and_report<std::complex<double>>(conf, A);
        break;
      default:
        run_and_report<double>(conf, A);
    }
  } catch(const davidsonxx::not_converged_error& e) {
    console->error("{}", e.what());
    return 2;
  } catch(const std::exception& e) {
    console->error("{}", e.what());
    return 1;
  }

  return 0;
}
