#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "../linear_model/coordinate_descent.h"
#include "../linear_model/subgradient.h"
#include "../optimization/objective.h"
#include "../data/libsvm.h"
#include "../data/synthetic.h"

namespace py = pybind11;
using namespace lassolab;

namespace {

// History as [{"time": ..., "objective_function": ...}, ...] for plotting
py::list history_to_list(const History& history) {
    py::list out;
    for (const auto& r : history.records()) {
        py::dict rec;
        rec["time"] = r.time;
        rec["objective_function"] = r.objective_function;
        out.append(rec);
    }
    return out;
}

// Python-facing wrapper: owns the generator so repeated fit() calls continue the stream
template <typename Solver>
class FitLasso {
public:
    Solver solver;
    LassoResult result;
    bool is_fitted = false;
    std::mt19937 rng;

    explicit FitLasso(unsigned int seed) : rng(seed) {}

    FitLasso& fit_dense(const Eigen::MatrixXd& A, const Eigen::VectorXd& b) {
        result = solver.fit(A, b, rng);
        is_fitted = true;
        return *this;
    }

    FitLasso& fit_sparse(const Eigen::SparseMatrix<double>& A, const Eigen::VectorXd& b) {
        result = solver.fit(A, b, rng);
        is_fitted = true;
        return *this;
    }

    const LassoResult& get() const {
        if (!is_fitted) throw std::runtime_error("Model must be fitted first");
        return result;
    }
};

using FitCD = FitLasso<CoordinateDescent>;
using FitSGD = FitLasso<StochasticSubgradient>;

template <typename Wrapper>
void def_result_properties(py::class_<Wrapper>& cls) {
    cls.def_property_readonly("coef_", [](const Wrapper& self) { return self.get().coef; })
       .def_property_readonly("residual_", [](const Wrapper& self) { return self.get().residual; })
       .def_property_readonly("objective_value", [](const Wrapper& self) { return self.get().objective_value; })
       .def_property_readonly("n_iter_", [](const Wrapper& self) { return self.get().iterations; })
       .def_property_readonly("history", [](const Wrapper& self) { return history_to_list(self.get().history); });
}

} // namespace

PYBIND11_MODULE(lassolab, m) {
    m.doc() = "Lassolab: Lasso by coordinate descent and stochastic subgradient";

    m.def("lasso_objective",
          [](const Eigen::MatrixXd& A, const Eigen::VectorXd& b, double lambda,
             const Eigen::VectorXd& alpha) {
              return lasso_objective(A, b, lambda, alpha);
          },
          py::arg("A"), py::arg("b"), py::arg("lambda_"), py::arg("alpha"));

    m.def("lasso_objective_sparse",
          [](const Eigen::SparseMatrix<double>& A, const Eigen::VectorXd& b, double lambda,
             const Eigen::VectorXd& alpha) {
              return lasso_objective(SparseDesignMatrix(A), b, lambda, alpha);
          },
          py::arg("A"), py::arg("b"), py::arg("lambda_"), py::arg("alpha"));

    py::enum_<CoordinateSelection>(m, "CoordinateSelection")
        .value("Random", CoordinateSelection::Random)
        .value("Cyclic", CoordinateSelection::Cyclic);

    py::enum_<BatchScaling>(m, "BatchScaling")
        .value("Unbiased", BatchScaling::Unbiased)
        .value("Mean", BatchScaling::Mean)
        .value("Sum", BatchScaling::Sum);

    py::enum_<StepSchedule>(m, "StepSchedule")
        .value("Constant", StepSchedule::Constant)
        .value("InverseSqrt", StepSchedule::InverseSqrt);

    py::class_<FitCD> cd(m, "CoordinateDescent");
    cd.def(py::init<unsigned int>(), py::arg("seed") = 42)
      .def_property("lambda_",
                    [](const FitCD& self) { return self.solver.lambda; },
                    [](FitCD& self, double v) { self.solver.lambda = v; })
      .def_property("max_iter",
                    [](const FitCD& self) { return self.solver.max_iter; },
                    [](FitCD& self, int v) { self.solver.max_iter = v; })
      .def_property("trace",
                    [](const FitCD& self) { return self.solver.trace; },
                    [](FitCD& self, bool v) { self.solver.trace = v; })
      .def_property("is_check",
                    [](const FitCD& self) { return self.solver.check; },
                    [](FitCD& self, bool v) { self.solver.check = v; })
      .def_property("check_epsilon",
                    [](const FitCD& self) { return self.solver.check_epsilon; },
                    [](FitCD& self, double v) { self.solver.check_epsilon = v; })
      .def_property("check_tolerance",
                    [](const FitCD& self) { return self.solver.check_tolerance; },
                    [](FitCD& self, double v) { self.solver.check_tolerance = v; })
      .def_property("selection",
                    [](const FitCD& self) { return self.solver.selection; },
                    [](FitCD& self, CoordinateSelection v) { self.solver.selection = v; })
      .def_property("verbose",
                    [](const FitCD& self) { return self.solver.verbose; },
                    [](FitCD& self, bool v) { self.solver.verbose = v; })
      .def("fit", &FitCD::fit_dense, py::return_value_policy::reference,
           py::arg("A"), py::arg("b"))
      .def("fit", &FitCD::fit_sparse, py::return_value_policy::reference,
           py::arg("A"), py::arg("b"))
      .def_property_readonly("checks_performed", [](const FitCD& self) { return self.get().checks_performed; })
      .def_property_readonly("check_failures", [](const FitCD& self) { return self.get().check_failures; })
      .def_property_readonly("check_roundoff", [](const FitCD& self) { return self.get().check_roundoff; });
    def_result_properties(cd);

    py::class_<FitSGD> sgd(m, "StochasticSubgradient");
    sgd.def(py::init<unsigned int>(), py::arg("seed") = 42)
       .def_property("lambda_",
                     [](const FitSGD& self) { return self.solver.lambda; },
                     [](FitSGD& self, double v) { self.solver.lambda = v; })
       .def_property("gamma",
                     [](const FitSGD& self) { return self.solver.step_size; },
                     [](FitSGD& self, double v) { self.solver.step_size = v; })
       .def_property("batch_size",
                     [](const FitSGD& self) { return self.solver.batch_size; },
                     [](FitSGD& self, int v) { self.solver.batch_size = v; })
       .def_property("max_iter",
                     [](const FitSGD& self) { return self.solver.max_iter; },
                     [](FitSGD& self, int v) { self.solver.max_iter = v; })
       .def_property("trace",
                     [](const FitSGD& self) { return self.solver.trace; },
                     [](FitSGD& self, bool v) { self.solver.trace = v; })
       .def_property("verbose",
                     [](const FitSGD& self) { return self.solver.verbose; },
                     [](FitSGD& self, bool v) { self.solver.verbose = v; })
       .def_property("scaling",
                     [](const FitSGD& self) { return self.solver.scaling; },
                     [](FitSGD& self, BatchScaling v) { self.solver.scaling = v; })
       .def_property("schedule",
                     [](const FitSGD& self) { return self.solver.schedule; },
                     [](FitSGD& self, StepSchedule v) { self.solver.schedule = v; })
       .def("fit", &FitSGD::fit_dense, py::return_value_policy::reference,
            py::arg("A"), py::arg("b"))
       .def("fit", &FitSGD::fit_sparse, py::return_value_policy::reference,
            py::arg("A"), py::arg("b"));
    def_result_properties(sgd);

    m.def("load_libsvm",
          [](const std::string& path, int n_features) {
              LibSVMData data = load_libsvm(path, n_features);
              return py::make_tuple(Eigen::SparseMatrix<double>(data.X.eigen()), data.y);
          },
          py::arg("path"), py::arg("n_features") = 0);

    m.def("make_random_problem",
          [](int n_samples, int n_features, unsigned int seed) {
              std::mt19937 gen(seed);
              SyntheticProblem p = make_random_problem(n_samples, n_features, gen);
              return py::make_tuple(p.A, p.b);
          },
          py::arg("n_samples"), py::arg("n_features"), py::arg("seed") = 42);

    m.def("make_sparse_regression",
          [](int n_samples, int n_features, int n_nonzero, double noise_sd, unsigned int seed) {
              std::mt19937 gen(seed);
              SyntheticProblem p = make_sparse_regression(n_samples, n_features, n_nonzero, noise_sd, gen);
              return py::make_tuple(p.A, p.b, p.true_coef);
          },
          py::arg("n_samples"), py::arg("n_features"), py::arg("n_nonzero"),
          py::arg("noise_sd") = 0.1, py::arg("seed") = 42);
}
