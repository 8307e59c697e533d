#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE workflow

#include "boost/test/unit_test.hpp"

#include "seasonfit/FitConfig.hpp"
#include "seasonfit/JsonUtils.hpp"
#include "seasonfit/SeasonFitWorkflow.hpp"
#include "seasonfit/SeriesLoaders.hpp"
#include "seasonfit/ReportUtils.hpp"
#include "seasonfit/ThreadPool.hpp"
#include "seasonfit/PriorEstimator.hpp"
#include "seasonfit/Errors.hpp"
#include "SyntheticSeries.hpp"

namespace fs = std::filesystem;
using namespace seasonfit;
using seasonfit::test::params;

namespace {

const Vector kTruth = params({1.0, 5.0, 5.0, 1.0, -5.0, 14.0, 1.0});

/* scratch directory removed again when the fixture goes out of scope */
struct ScratchDir {
    fs::path path;

    ScratchDir()
        : path(fs::temp_directory_path() /
               ("seasonfit_test_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter()++)))
    {
        fs::create_directories(path);
    }
    ~ScratchDir() { std::error_code ec; fs::remove_all(path, ec); }

    static int& counter() { static int n = 0; return n; }

    fs::path write(const std::string& name, const std::string& text) const
    {
        const fs::path p = path / name;
        std::ofstream(p) << text;
        return p;
    }
};

} // namespace

/* ----------------------------- configuration ----------------------------- */

BOOST_AUTO_TEST_CASE(parseFullConfig) {
    ::setenv("SEASONFIT_TEST_DATA", "/data/ndvi", 1);

    const nlohmann::json j = nlohmann::json::parse(R"({
        "model":   "Logistic",
        "data":    ["${SEASONFIT_TEST_DATA}/site_a.dat", "site_b.dat"],
        "prior":   [0.3, 2.0, 120, 0.08, -2.0, 280, 0.08],
        "fixed":   [true, false, false, false, false, false, false],
        "options": { "maxIterations": 50, "tolerance": 1e-6,
                     "precision": "single", "derivatives": "numeric",
                     "maxDampingSteps": 12 },
        "output":  { "directory": "out", "curveSamples": false }
    })");

    const FitConfig cfg = parse_fit_config(j);
    BOOST_CHECK(cfg.model == ModelKind::Logistic);
    BOOST_REQUIRE_EQUAL(cfg.data.size(), 2u);
    BOOST_CHECK_EQUAL(cfg.data[0], "/data/ndvi/site_a.dat");
    BOOST_CHECK_EQUAL(cfg.data[1], "site_b.dat");
    BOOST_REQUIRE(cfg.prior.has_value());
    BOOST_CHECK_EQUAL((*cfg.prior)[2], 120.0);

    BOOST_CHECK_EQUAL(cfg.options.max_iterations, 50);
    BOOST_CHECK_EQUAL(cfg.options.tolerance, 1e-6);
    BOOST_CHECK_EQUAL(cfg.options.max_damping_steps, 12);
    BOOST_CHECK(cfg.options.precision == Precision::Single);
    BOOST_CHECK(cfg.options.derivatives == DerivativeMode::Numeric);
    BOOST_REQUIRE_EQUAL(cfg.options.fixed.size(), 7u);
    BOOST_CHECK(cfg.options.fixed[0]);
    BOOST_CHECK(!cfg.options.fixed[1]);

    BOOST_CHECK_EQUAL(cfg.output.directory.string(), "out");
    BOOST_CHECK(!cfg.output.curve_samples);
    BOOST_CHECK(cfg.output.result_json);
}

BOOST_AUTO_TEST_CASE(parseMinimalConfig) {
    const FitConfig cfg = parse_fit_config(
        nlohmann::json::parse(R"({"model": "tanh", "data": "one.dat"})"));
    BOOST_CHECK(cfg.model == ModelKind::HyperbolicTangent);
    BOOST_REQUIRE_EQUAL(cfg.data.size(), 1u);
    BOOST_CHECK(!cfg.prior.has_value());
    BOOST_CHECK_EQUAL(cfg.options.max_iterations, 20);
    BOOST_CHECK_EQUAL(cfg.options.tolerance, 1e-3);
    BOOST_CHECK(cfg.options.fixed.empty());
}

BOOST_AUTO_TEST_CASE(rejectBadConfig) {
    using nlohmann::json;
    BOOST_CHECK_THROW(parse_fit_config(json::parse(R"({"model": "spline", "data": "a"})")),
                      InputValidationError);
    BOOST_CHECK_THROW(parse_fit_config(json::parse(R"({"model": "sine", "data": []})")),
                      InputValidationError);
    BOOST_CHECK_THROW(parse_fit_config(json::parse(
                          R"({"model": "sine", "data": "a", "prior": [1, 2, 3]})")),
                      InputValidationError);
    BOOST_CHECK_THROW(parse_fit_config(json::parse(
                          R"({"model": "sine", "data": "a", "options": {"maxIterations": 0}})")),
                      InputValidationError);
    BOOST_CHECK_THROW(parse_fit_config(json::parse(
                          R"({"model": "sine", "data": "a", "options": {"precision": "half"}})")),
                      InputValidationError);
    BOOST_CHECK_THROW(parse_fit_config(json::parse(R"({"data": "a"})")),
                      json::out_of_range);
}

BOOST_AUTO_TEST_CASE(fitOptionsJson) {
    FitOptions o;
    o.max_iterations = 7;
    o.derivatives    = DerivativeMode::Numeric;

    const nlohmann::json j = o;
    BOOST_CHECK_EQUAL(j.at("maxIterations").get<int>(), 7);
    BOOST_CHECK_EQUAL(j.at("derivatives").get<std::string>(), "numeric");
    BOOST_CHECK_EQUAL(j.at("precision").get<std::string>(), "double");
    BOOST_CHECK(!j.contains("fixed"));

    const FitOptions back = j.get<FitOptions>();
    BOOST_CHECK_EQUAL(back.max_iterations, 7);
    BOOST_CHECK(back.derivatives == DerivativeMode::Numeric);
}

BOOST_AUTO_TEST_CASE(expandEnvironment) {
    ::setenv("SEASONFIT_TEST_SITE", "alpine", 1);
    ::unsetenv("SEASONFIT_TEST_UNSET");
    nlohmann::json j = {{"a", "${SEASONFIT_TEST_SITE}/x"},
                        {"b", {"${SEASONFIT_TEST_UNSET}y", 3}}};
    expand_env(j);
    BOOST_CHECK_EQUAL(j["a"].get<std::string>(), "alpine/x");
    BOOST_CHECK_EQUAL(j["b"].at(0).get<std::string>(), "y");
    BOOST_CHECK_EQUAL(j["b"].at(1).get<int>(), 3);
}

BOOST_AUTO_TEST_CASE(expandEnvironmentOnce) {
    ::setenv("SEASONFIT_TEST_SELF", "${SEASONFIT_TEST_SELF}", 1);
    ::setenv("SEASONFIT_TEST_SITE", "alpine", 1);
    nlohmann::json j = "${SEASONFIT_TEST_SELF}/${SEASONFIT_TEST_SITE}";
    expand_env(j);
    BOOST_CHECK_EQUAL(j.get<std::string>(), "${SEASONFIT_TEST_SELF}/alpine");
}

/* ------------------------------- results --------------------------------- */

BOOST_AUTO_TEST_CASE(fitResultJson) {
    const ObservationSeries s = test::noisy_logistic(kTruth);
    SeasonFitWorkflow::Config cfg;
    SeasonFitWorkflow wf(s, cfg);
    const FitResult& r = wf.run();

    const nlohmann::json j = r;
    for (const char* key : {"model", "status", "iterations", "initialChi2", "chi2",
                            "standardError", "nEffective", "prior", "params",
                            "paramUncertainties", "chi2History"})
        BOOST_CHECK_MESSAGE(j.contains(key), "missing key " << key);

    BOOST_CHECK_EQUAL(j.at("model").get<std::string>(), "logistic");
    BOOST_CHECK_EQUAL(j.at("status").get<std::string>(), to_string(r.status));
    BOOST_CHECK_EQUAL(j.at("params").size(), 7u);
    BOOST_CHECK_EQUAL(j.at("nEffective").get<int>(), 20);
    BOOST_CHECK_EQUAL(j.at("chi2History").size(), r.chi2_history.size());
}

BOOST_AUTO_TEST_CASE(printSummaryLine) {
    FitResult r;
    r.model  = ModelKind::Sine;
    r.status = FitStatus::Diverged;
    r.params = params({0, 1, 2, 3, 4, 5, 6});
    std::ostringstream os;
    print_summary(os, "site_a", r);
    BOOST_CHECK(os.str().find("site_a") != std::string::npos);
    BOOST_CHECK(os.str().find("sine") != std::string::npos);
    BOOST_CHECK(os.str().find("diverged") != std::string::npos);
}

/* ------------------------------- workflow -------------------------------- */

BOOST_AUTO_TEST_CASE(workflowRun) {
    const ObservationSeries s = test::noisy_logistic(kTruth);
    SeasonFitWorkflow::Config cfg;
    cfg.model = ModelKind::Logistic;
    SeasonFitWorkflow wf(s, cfg);

    BOOST_CHECK(!wf.done());
    BOOST_CHECK_THROW(wf.curves(), std::logic_error);

    const FitResult& r = wf.run();
    BOOST_CHECK(wf.done());
    BOOST_CHECK(wf.prior().isApprox(estimate_prior(s, ModelKind::Logistic)));
    BOOST_CHECK(r.prior.isApprox(wf.prior()));
    BOOST_CHECK(r.converged());

    const CurveSamples on_data = wf.curves();
    BOOST_CHECK_EQUAL(on_data.x.size(), s.size());
    BOOST_CHECK((on_data.model - (on_data.comp1 + on_data.comp2)).array()
                    .isApproxToConstant(r.params[BASE], 1e-12));

    const CurveSamples dense = wf.curves(101);
    BOOST_CHECK_EQUAL(dense.x.size(), 101);
    BOOST_CHECK_EQUAL(dense.x[0], 0.0);
    BOOST_CHECK_SMALL(dense.x[100] - 19.0, 1e-12);
    BOOST_CHECK_EQUAL(dense.raw_y.size(), s.size());
    BOOST_CHECK_EQUAL(dense.iterations, r.iterations);
}

BOOST_AUTO_TEST_CASE(workflowWithSuppliedPrior) {
    const ObservationSeries s = test::noisy_logistic(kTruth);
    SeasonFitWorkflow::Config cfg;
    cfg.prior = kTruth;
    SeasonFitWorkflow wf(s, cfg);
    wf.run();
    BOOST_CHECK(wf.prior() == kTruth);
    BOOST_CHECK(wf.result().converged());
}

BOOST_AUTO_TEST_CASE(batchKeepsOrderAndReportsRejects) {
    std::vector<ObservationSeries> series;
    series.push_back(test::noisy_logistic(kTruth));

    ObservationSeries too_short;
    too_short.x = series[0].x.head(6);
    too_short.y = series[0].y.head(6);
    series.push_back(too_short);

    ObservationSeries shifted = test::noisy_logistic(kTruth);
    shifted.y.array() += 0.5;
    series.push_back(shifted);

    SeasonFitWorkflow::Config cfg;
    cfg.options.max_iterations = 100;
    cfg.options.tolerance      = 1e-10;
    const auto batch = fit_batch(series, {}, cfg, 2);

    BOOST_REQUIRE_EQUAL(batch.size(), 3u);
    BOOST_CHECK_EQUAL(batch[0].name, "series_0");
    BOOST_CHECK_EQUAL(batch[2].name, "series_2");

    BOOST_REQUIRE(batch[0].result.has_value());
    BOOST_CHECK(!batch[1].result.has_value());
    BOOST_CHECK(!batch[1].error.empty());
    BOOST_REQUIRE(batch[2].result.has_value());

    /* a constant shift moves only the base level */
    BOOST_CHECK_CLOSE_FRACTION(batch[2].result->params[BASE],
                               batch[0].result->params[BASE] + 0.5, 1e-3);
    BOOST_CHECK_CLOSE_FRACTION(batch[2].result->params[RISE_A],
                               batch[0].result->params[RISE_A], 1e-3);

    BOOST_CHECK_THROW(fit_batch(series, {"a"}, cfg, 1), InputValidationError);
}

BOOST_AUTO_TEST_CASE(threadPoolRunsEveryTask) {
    std::atomic<int> counter{0};
    std::vector<std::future<int>> results;
    {
        ThreadPool pool(3);
        BOOST_CHECK_EQUAL(pool.size(), 3u);
        for (int i = 0; i < 100; ++i)
            results.push_back(pool.submit([i, &counter]() { ++counter; return i * i; }));
    }
    BOOST_CHECK_EQUAL(counter.load(), 100);
    int sum = 0;
    for (auto& f : results) sum += f.get();
    BOOST_CHECK_EQUAL(sum, 328350);

    ThreadPool single(0);
    BOOST_CHECK_EQUAL(single.size(), 1u);
}

/* ------------------------------- file I/O -------------------------------- */

BOOST_AUTO_TEST_CASE(loadThreeColumnSeries) {
    ScratchDir dir;
    const fs::path p = dir.write("site.dat",
        "# day  ndvi  weight\n"
        "3  0.30  1.0\n"
        "\n"
        "1  0.25  0.5\n"
        "   # indented comment\n"
        "2  0.28  0.0\n");

    const ObservationSeries s = load_series_ascii(p.string());
    BOOST_REQUIRE_EQUAL(s.size(), 3);
    BOOST_REQUIRE_EQUAL(s.w.size(), 3);
    BOOST_CHECK_EQUAL(s.x[0], 1.0);
    BOOST_CHECK_EQUAL(s.y[0], 0.25);
    BOOST_CHECK_EQUAL(s.w[0], 0.5);
    BOOST_CHECK_EQUAL(s.x[1], 2.0);
    BOOST_CHECK_EQUAL(s.w[1], 0.0);
    BOOST_CHECK_EQUAL(s.x[2], 3.0);
    BOOST_CHECK_EQUAL(s.n_effective(), 2);
}

BOOST_AUTO_TEST_CASE(loadTwoColumnSeries) {
    ScratchDir dir;
    const fs::path p = dir.write("site.dat", "1 0.1\n2 0.2\n");
    const ObservationSeries s = load_series_ascii(p.string());
    BOOST_CHECK_EQUAL(s.size(), 2);
    BOOST_CHECK_EQUAL(s.w.size(), 0);
    BOOST_CHECK_EQUAL(s.weights().sum(), 2.0);
}

BOOST_AUTO_TEST_CASE(loadErrors) {
    ScratchDir dir;
    BOOST_CHECK_THROW(load_series_ascii((dir.path / "missing.dat").string()),
                      std::runtime_error);
    BOOST_CHECK_THROW(load_series_ascii(dir.write("empty.dat", "# nothing\n").string()),
                      std::runtime_error);
    BOOST_CHECK_THROW(load_series_ascii(dir.write("ragged.dat", "1 2 1\n2 3\n").string()),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(writeThenLoadSeries) {
    ScratchDir dir;
    ObservationSeries s = test::noisy_logistic(kTruth);
    s.w = Vector::Ones(s.size());
    s.w[4] = 0.0;

    const fs::path p = dir.path / "mock.dat";
    write_series_ascii(p.string(), s, "model logistic");

    const ObservationSeries back = load_series_ascii(p.string());
    BOOST_REQUIRE_EQUAL(back.size(), s.size());
    BOOST_CHECK(back.x.isApprox(s.x, 1e-9));
    BOOST_CHECK(back.y.isApprox(s.y, 1e-9));
    BOOST_CHECK_EQUAL(back.w[4], 0.0);
    BOOST_CHECK_EQUAL(back.n_effective(), 19);
}

BOOST_AUTO_TEST_CASE(writeResultFiles) {
    ScratchDir dir;
    const ObservationSeries s = test::noisy_logistic(kTruth);
    SeasonFitWorkflow::Config cfg;
    SeasonFitWorkflow wf(s, cfg);
    const FitResult& r = wf.run();

    OutputConfig out;
    out.directory = dir.path / "nested" / "out";
    write_results(out, "site_a", r, s);

    const fs::path json_path = out.directory / "site_a_fit.json";
    const fs::path dat_path  = out.directory / "site_a_curves.dat";
    BOOST_REQUIRE(fs::exists(json_path));
    BOOST_REQUIRE(fs::exists(dat_path));

    const nlohmann::json j = load_json(json_path.string());
    BOOST_CHECK_EQUAL(j.at("iterations").get<int>(), r.iterations);
    BOOST_CHECK_CLOSE_FRACTION(j.at("params").at(RISE_A).get<double>(), r.params[RISE_A], 1e-12);

    std::ifstream in(dat_path);
    std::string line;
    int rows = 0;
    while (std::getline(in, line))
        if (!line.empty() && line[0] != '#') ++rows;
    BOOST_CHECK_EQUAL(rows, 200);

    OutputConfig none;
    none.directory     = dir.path / "never";
    none.result_json   = false;
    none.curve_samples = false;
    write_results(none, "site_a", r, s);
    BOOST_CHECK(!fs::exists(none.directory));
}

BOOST_AUTO_TEST_CASE(loadJsonErrors) {
    ScratchDir dir;
    BOOST_CHECK_THROW(load_json((dir.path / "nope.json").string()), std::runtime_error);
    BOOST_CHECK_THROW(load_json(dir.write("bad.json", "{ not json").string()),
                      std::runtime_error);
}
