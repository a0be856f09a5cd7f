#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "paircorr_core.hpp"
#include "paircorr_errors.hpp"
#include "paircorr_log.hpp"

#include <algorithm>
#include <optional>

namespace py = pybind11;

using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

namespace {

/**
 * Copy an (N, k) array into a flat row-major vector.
 *
 * @param arr   numpy array
 * @param name  argument name for error messages
 * @param cols  output: number of columns k
 */
std::vector<double> flatten_2d(const DoubleArray& arr, const char* name, size_t& cols) {
    auto buf = arr.request();
    if (buf.ndim != 2) {
        throw paircorr::ShapeMismatchError(fmt::format("{} must be a 2D array of shape (N, k)", name));
    }
    cols = static_cast<size_t>(buf.shape[1]);
    const double* ptr = static_cast<const double*>(buf.ptr);
    return std::vector<double>(ptr, ptr + buf.shape[0] * buf.shape[1]);
}

std::vector<double> flatten_1d(const DoubleArray& arr, const char* name) {
    auto buf = arr.request();
    if (buf.ndim != 1) {
        throw paircorr::ShapeMismatchError(fmt::format("{} must be a 1D array", name));
    }
    const double* ptr = static_cast<const double*>(buf.ptr);
    return std::vector<double>(ptr, ptr + buf.shape[0]);
}

paircorr::ParticleSet make_particles(
    const DoubleArray& positions,
    const std::optional<DoubleArray>& orientations,
    const std::optional<DoubleArray>& weights
) {
    paircorr::ParticleSet particles;
    particles.positions = flatten_2d(positions, "positions", particles.dim);
    particles.n = static_cast<size_t>(positions.shape(0));

    if (orientations) {
        size_t cols = 0;
        particles.orientations = flatten_2d(*orientations, "orientations", cols);
        if (orientations->shape(0) != positions.shape(0) || cols != particles.dim) {
            throw paircorr::ShapeMismatchError(fmt::format(
                "Shape of orientations must match positions array ({}, {})", particles.n, particles.dim));
        }
    }

    if (weights) {
        particles.weights = flatten_2d(*weights, "weights", particles.weight_dim);
        if (weights->shape(0) != positions.shape(0)) {
            throw paircorr::ShapeMismatchError(fmt::format(
                "Shape of weights must be ({}, k)", particles.n));
        }
    }

    return particles;
}

py::array_t<double> to_array(const std::vector<double>& values) {
    py::array_t<double> arr(static_cast<py::ssize_t>(values.size()));
    std::copy(values.begin(), values.end(), arr.mutable_data());
    return arr;
}

py::tuple grid_to_tuple(const paircorr::DistributionGrid& grid, size_t dim) {
    std::vector<py::ssize_t> shape(grid.shape.begin(), grid.shape.end());
    py::array_t<double> g(shape);
    std::copy(grid.values.begin(), grid.values.end(), g.mutable_data());

    if (dim == 3) {
        return py::make_tuple(g, to_array(grid.r), to_array(grid.phi), to_array(grid.theta));
    }
    return py::make_tuple(g, to_array(grid.r), to_array(grid.phi));
}

} // anonymous namespace

/**
 * Python wrapper for the weighted 2-point correlation function.
 *
 * @param positions     numpy array of shape (N, d), d = 2 or 3
 * @param boxsize       periodic box side lengths (d,)
 * @param weights       optional numpy array of shape (N, k)
 * @param z             exponent in <(w_i . w_j)^z>
 * @param orientations  optional numpy array of shape (N, d)
 * @param rmin          minimum r, default 0
 * @param rmax          cutoff, default max(boxsize) / 2
 * @param nr            r bins
 * @param nphi          phi bins, unbinned if None
 * @param ntheta        theta bins, unbinned if None (always in 2D)
 * @return              tuple (g, r, phi) in 2D or (g, r, phi, theta) in 3D
 */
py::tuple py_corr(
    DoubleArray positions,
    std::vector<double> boxsize,
    std::optional<DoubleArray> weights,
    double z,
    std::optional<DoubleArray> orientations,
    std::optional<double> rmin,
    std::optional<double> rmax,
    int nr,
    std::optional<int> nphi,
    std::optional<int> ntheta
) {
    paircorr::Box box{boxsize};
    paircorr::ParticleSet particles = make_particles(positions, orientations, weights);

    paircorr::CorrelationOptions options;
    options.rmin = rmin;
    options.rmax = rmax;
    options.nr = nr;
    options.nphi = nphi;
    options.ntheta = ntheta;
    options.z = z;

    paircorr::DistributionGrid grid;
    {
        py::gil_scoped_release release;
        grid = paircorr::compute_correlation(particles, box, options);
    }
    return grid_to_tuple(grid, box.dim());
}

/**
 * Python wrapper for the spatial distribution function g(r, phi, theta).
 * Same as py_corr without weights.
 */
py::tuple py_sdf(
    DoubleArray positions,
    std::vector<double> boxsize,
    std::optional<DoubleArray> orientations,
    std::optional<double> rmin,
    std::optional<double> rmax,
    int nr,
    std::optional<int> nphi,
    std::optional<int> ntheta
) {
    return py_corr(positions, boxsize, std::nullopt, 1.0, orientations, rmin, rmax, nr, nphi, ntheta);
}

/**
 * Python wrapper for the isotropic Fourier transform.
 *
 * @param gr                 correlation values, shape (nr,)
 * @param r                  radial sample points, shape (nr,)
 * @param N                  number of particles
 * @param boxsize            periodic box side lengths
 * @param q                  optional wavenumbers
 * @param subtract_baseline  integrate gr - 1 instead of gr
 * @return                   tuple (S, q)
 */
py::tuple py_transform(
    DoubleArray gr,
    DoubleArray r,
    size_t N,
    std::vector<double> boxsize,
    std::optional<DoubleArray> q,
    bool subtract_baseline
) {
    paircorr::Box box{boxsize};
    std::vector<double> g_values = flatten_1d(gr, "gr");
    std::vector<double> r_values = flatten_1d(r, "r");

    std::optional<std::vector<double>> q_values;
    if (q) {
        q_values = flatten_1d(*q, "q");
    }

    paircorr::StructureFactorResult result;
    {
        py::gil_scoped_release release;
        result = paircorr::compute_structure_factor(g_values, r_values, N, box, q_values, subtract_baseline);
    }
    return py::make_tuple(to_array(result.s), to_array(result.q));
}

/**
 * Python wrapper returning a wrapped copy of the positions.
 */
py::array_t<double> py_impose_pbc(DoubleArray positions, std::vector<double> boxsize) {
    paircorr::Box box{boxsize};
    paircorr::ParticleSet particles = make_particles(positions, std::nullopt, std::nullopt);
    paircorr::validate_inputs(particles, box);

    std::vector<double> wrapped = paircorr::wrap_positions(particles.positions, particles.n, box);

    py::array_t<double> result({static_cast<py::ssize_t>(particles.n), static_cast<py::ssize_t>(particles.dim)});
    std::copy(wrapped.begin(), wrapped.end(), result.mutable_data());
    return result;
}

/**
 * Python wrapper for the doubled pair list.
 *
 * @return numpy array of shape (2P, 2): (i, j) with i < j, then (j, i)
 */
py::array_t<int64_t> py_get_pairs(DoubleArray positions, std::vector<double> boxsize, double rmax) {
    paircorr::Box box{boxsize};
    paircorr::ParticleSet particles = make_particles(positions, std::nullopt, std::nullopt);
    paircorr::validate_inputs(particles, box);

    paircorr::PairList pairs;
    {
        py::gil_scoped_release release;
        std::vector<double> wrapped = paircorr::wrap_positions(particles.positions, particles.n, box);
        pairs = paircorr::find_pairs(wrapped, particles.n, box, rmax);
    }

    py::array_t<int64_t> result({static_cast<py::ssize_t>(pairs.size()), static_cast<py::ssize_t>(2)});
    auto result_buf = result.mutable_unchecked<2>();
    for (size_t k = 0; k < pairs.size(); ++k) {
        result_buf(k, 0) = static_cast<int64_t>(pairs[k][0]);
        result_buf(k, 1) = static_cast<int64_t>(pairs[k][1]);
    }
    return result;
}

PYBIND11_MODULE(_core, m) {
    m.doc() = "Pair correlation and structure factor C++ core module";

    auto base_exc = py::register_exception<paircorr::Error>(m, "Error", PyExc_RuntimeError);
    auto config_exc = py::register_exception<paircorr::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<paircorr::InvalidDimensionError>(m, "InvalidDimensionError", config_exc.ptr());
    py::register_exception<paircorr::ShapeMismatchError>(m, "ShapeMismatchError", config_exc.ptr());
    py::register_exception<paircorr::EmptyResultError>(m, "EmptyResultError", base_exc.ptr());

    m.def("corr", &py_corr,
          py::arg("positions"),
          py::arg("boxsize"),
          py::arg("weights") = py::none(),
          py::arg("z") = 1.0,
          py::arg("orientations") = py::none(),
          py::arg("rmin") = py::none(),
          py::arg("rmax") = py::none(),
          py::arg("nr") = 100,
          py::arg("nphi") = py::none(),
          py::arg("ntheta") = py::none(),
          R"doc(
          Compute the 2-point correlation function G(r, phi, theta).

          Without weights this is the spatial distribution function g.
          With weights w_i it is <(w_i . w_j)^z> over pair displacements.
          With orientations p_i, displacements are rotated so that p_i
          points along +y (2D) or +z (3D).

          Parameters
          ----------
          positions : ndarray, shape (N, d)
              Particle positions, d = 2 or 3
          boxsize : list of float
              Periodic box side lengths
          weights : ndarray, shape (N, k), optional
              Particle vectors w_i
          z : float
              Exponent in (w_i . w_j)^z
          orientations : ndarray, shape (N, d), optional
              Particle orientations, normalized automatically
          rmin : float, optional
              Minimum r (default 0)
          rmax : float, optional
              Cutoff radius (default max(boxsize) / 2)
          nr, nphi, ntheta : int, optional
              Bin counts; None or 1 leaves the axis unbinned

          Returns
          -------
          tuple
              (g, r, phi) in 2D, (g, r, phi, theta) in 3D. g has one
              dimension per binned axis; the others hold left bin edges.

          Raises
          ------
          ConfigurationError
              Bad dimension, shapes or binning parameters
          EmptyResultError
              No pair within rmax
          )doc"
    );

    m.def("sdf", &py_sdf,
          py::arg("positions"),
          py::arg("boxsize"),
          py::arg("orientations") = py::none(),
          py::arg("rmin") = py::none(),
          py::arg("rmax") = py::none(),
          py::arg("nr") = 100,
          py::arg("nphi") = py::none(),
          py::arg("ntheta") = py::none(),
          R"doc(
          Compute the spatial distribution function g(r, phi, theta).

          Reduces to the radial distribution function g(r) when nphi and
          ntheta are None. See corr for parameters and return values.
          )doc"
    );

    m.def("structure_factor",
          [](DoubleArray gr, DoubleArray r, size_t N, std::vector<double> boxsize, std::optional<DoubleArray> q) {
              return py_transform(gr, r, N, boxsize, q, true);
          },
          py::arg("gr"),
          py::arg("r"),
          py::arg("N"),
          py::arg("boxsize"),
          py::arg("q") = py::none(),
          R"doc(
          Isotropic structure factor S(q) from g(r).

          3D: S(q) = 1 + 4 pi rho / q * int dr r sin(qr) [g(r) - 1]
          2D: S(q) = 1 + 2 pi rho * int dr r J0(qr) [g(r) - 1]

          Parameters
          ----------
          gr : ndarray
              Radial distribution function g(r)
          r : ndarray
              Domain of g(r)
          N : int
              Number of particles
          boxsize : list of float
              Periodic box side lengths
          q : ndarray, optional
              Wavenumbers (default dq, 2 dq, ..., 199 dq with dq = 2 pi / max(boxsize))

          Returns
          -------
          tuple
              (S, q)
          )doc"
    );

    m.def("fourier_corr",
          [](DoubleArray gr, DoubleArray r, size_t N, std::vector<double> boxsize, std::optional<DoubleArray> q) {
              return py_transform(gr, r, N, boxsize, q, false);
          },
          py::arg("gr"),
          py::arg("r"),
          py::arg("N"),
          py::arg("boxsize"),
          py::arg("q") = py::none(),
          R"doc(
          Isotropic Fourier transform S(q) of a pair correlation G(r).

          Same as structure_factor but G(r) is integrated as given. Pass
          g(r) - 1 to recover the structure factor.
          )doc"
    );

    m.def("impose_pbc", &py_impose_pbc,
          py::arg("positions"),
          py::arg("boxsize"),
          R"doc(
          Return a copy of positions wrapped into [0, L) along every axis.
          )doc"
    );

    m.def("get_pairs", &py_get_pairs,
          py::arg("positions"),
          py::arg("boxsize"),
          py::arg("rmax"),
          R"doc(
          Ordered particle pairs closer than rmax under periodic boundaries.

          Returns
          -------
          ndarray, shape (2P, 2)
              (i, j) with i < j for the first P rows, swapped after.
          )doc"
    );

    m.def("set_log_level",
          [](const std::string& level) {
              paircorr::Logger::get().set_level(paircorr::parse_log_level(level));
          },
          py::arg("level"),
          R"doc(
          Set logging verbosity: "trace", "debug", "info", "warn", "error" or "off".
          )doc"
    );
}
