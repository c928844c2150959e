/**********************************************************************
 * predictor.cpp
 *
 *   train()   : labels (given or synthesized) → stratified split →
 *               scaler + model on the train side → test metrics + CV
 *   predict() : rule score while Untrained, model probability after
 *   persist() : model, scaler, encoders and column order in one blob
 *********************************************************************/
#include "induct/predictor.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "induct/common.hpp"
#include "induct/errors.hpp"
#include "induct/model_eval.hpp"

namespace induct {

namespace {
constexpr const char* kFormatTag     = "induct-model";
constexpr int         kFormatVersion = 1;

std::vector<int> threshold(const std::vector<double>& p)
{
    std::vector<int> out(p.size());
    for (std::size_t i = 0; i < p.size(); ++i) out[i] = p[i] > 0.5 ? 1 : 0;
    return out;
}

Eigen::MatrixXd take_rows(const Eigen::MatrixXd& X, const std::vector<int>& idx)
{
    Eigen::MatrixXd out(static_cast<Eigen::Index>(idx.size()), X.cols());
    for (std::size_t r = 0; r < idx.size(); ++r) out.row(static_cast<Eigen::Index>(r)) = X.row(idx[r]);
    return out;
}

std::vector<int> take(const std::vector<int>& v, const std::vector<int>& idx)
{
    std::vector<int> out;
    out.reserve(idx.size());
    for (int i : idx) out.push_back(v[static_cast<std::size_t>(i)]);
    return out;
}

std::vector<std::pair<std::string, double>>
rank_importance(const std::vector<std::string>& cols, const std::vector<double>& imp)
{
    std::vector<std::pair<std::string, double>> out;
    for (std::size_t c = 0; c < cols.size() && c < imp.size(); ++c) out.emplace_back(cols[c], imp[c]);
    std::stable_sort(out.begin(), out.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return out;
}

std::array<ClassMetrics, 2> class_report(const std::array<std::array<long, 2>, 2>& cm)
{
    std::array<ClassMetrics, 2> out{};
    for (std::size_t c = 0; c < 2; ++c) {
        const double tp = static_cast<double>(cm[c][c]);
        const double fp = static_cast<double>(cm[1 - c][c]);
        const double fn = static_cast<double>(cm[c][1 - c]);
        ClassMetrics& m = out[c];
        m.precision = (tp + fp) > 0 ? tp / (tp + fp) : 0.0;
        m.recall    = (tp + fn) > 0 ? tp / (tp + fn) : 0.0;
        m.f1        = (m.precision + m.recall) > 0
                        ? 2.0 * m.precision * m.recall / (m.precision + m.recall) : 0.0;
        m.support   = static_cast<std::size_t>(cm[c][0] + cm[c][1]);
    }
    return out;
}

} // namespace

/* ─────────────────── rules ─────────────────── */
double synthetic_induct_score(const TrainAttributes& t)
{
    double p = 0.5;
    if      (t.fitness_score >= 90) p += 0.3;
    else if (t.fitness_score >= 80) p += 0.1;
    else if (t.fitness_score < 70)  p -= 0.4;

    if (t.open_work_orders > 0) p -= 0.5;
    if (!t.cert_valid)          p -= 0.6;

    if      (t.recent_delays > 3)  p -= 0.2;
    else if (t.recent_delays == 0) p += 0.1;

    if      (t.days_since_maintenance > 21) p -= 0.1;
    else if (t.days_since_maintenance < 7)  p += 0.1;

    return clamp_val(p, 0.0, 1.0);
}

std::vector<int> synthesize_labels(const std::vector<TrainRecord>& data, std::mt19937& rng)
{
    std::uniform_real_distribution<double> U(0.0, 1.0);
    std::vector<int> y;
    y.reserve(data.size());
    for (const auto& t : resolve_all(data)) y.push_back(U(rng) < synthetic_induct_score(t) ? 1 : 0);
    return y;
}

double rule_probability(const TrainAttributes& t)
{
    if (t.open_work_orders > 0 || !t.cert_valid) return 0.1;
    if (t.fitness_score >= 85) return 0.9;
    if (t.fitness_score >= 75) return 0.8;
    if (t.fitness_score < 65)  return 0.3;
    return 0.7;
}

nlohmann::json TrainingReport::to_json() const
{
    nlohmann::json imp = nlohmann::json::array();
    for (const auto& kv : feature_importance) imp.push_back({{"feature", kv.first}, {"importance", kv.second}});
    nlohmann::json cls = nlohmann::json::object();
    for (std::size_t c = 0; c < 2; ++c)
        cls[std::to_string(c)] = {{"precision", per_class[c].precision},
                                  {"recall", per_class[c].recall},
                                  {"f1", per_class[c].f1},
                                  {"support", per_class[c].support}};
    return {{"model_type", model_type},
            {"accuracy", accuracy},
            {"cv_mean", cv_mean},
            {"cv_std", cv_std},
            {"cv_folds", cv_folds},
            {"feature_importance", imp},
            {"confusion_matrix", {{confusion[0][0], confusion[0][1]}, {confusion[1][0], confusion[1][1]}}},
            {"classification_report", cls},
            {"training_size", training_size},
            {"test_size", test_size},
            {"stratified", stratified},
            {"labels_synthesized", labels_synthesized}};
}

/* ─────────────────── Predictor ─────────────────── */
Predictor::Predictor(std::string model_type, TrainOpt opt, FeatureOptions fopt)
    : model_type_(std::move(model_type)), opt_(opt), fopt_(fopt), builder_(fopt)
{
    if (!is_known_model_type(model_type_))
        throw InputError("unknown model type '" + model_type_ + "'");
}

void Predictor::reset()
{
    builder_.reset();
    scaler_ = FeatureScaler{};
    model_.reset();
    importance_cols_.clear();
    trained_at_.clear();
}

TrainingReport Predictor::train(const std::vector<TrainRecord>& data)
{
    std::random_device rd;
    std::mt19937 rng(rd());
    return train(data, rng);
}

TrainingReport Predictor::train(const std::vector<TrainRecord>& data, std::mt19937& rng)
{
    if (data.size() < kMinTrainingSamples)
        throw InsufficientDataError("need at least " + std::to_string(kMinTrainingSamples) +
                                    " trains, got " + std::to_string(data.size()));
    validate_identifiers(data);

    TrainingReport rep;
    rep.model_type = model_type_;

    /* ---------- labels ---------- */
    const auto labelled = std::count_if(data.begin(), data.end(),
                                        [](const TrainRecord& r) { return r.target_induct.has_value(); });
    std::vector<int> y;
    y.reserve(data.size());
    if (labelled == static_cast<long>(data.size())) {
        for (const auto& r : data) {
            if (*r.target_induct != 0 && *r.target_induct != 1)
                throw InputError("target_induct of " + r.train_id + " is not 0/1");
            y.push_back(*r.target_induct);
        }
    } else if (labelled == 0) {
        rep.labels_synthesized = true;
        y = synthesize_labels(data, rng);
        logI("synthesized training labels for " + std::to_string(y.size()) + " trains");
    } else {
        throw InputError("target_induct present on " + std::to_string(labelled) + " of " +
                         std::to_string(data.size()) + " rows");
    }
    if (minority_count(y) == 0)
        throw InsufficientDataError("training labels contain a single class");

    /* ---------- features (on a copy: commit only on success) ---------- */
    FeatureBuilder nb = builder_;
    const FeatureTable tbl = nb.fit_transform(data);

    const Split sp = stratified_split(y, opt_.test_ratio, opt_.seed);
    if (!sp.stratified)
        logW("a class has fewer than 2 members; using the full data for train and test");
    rep.stratified    = sp.stratified;
    rep.training_size = sp.train.size();
    rep.test_size     = sp.test.size();

    const Eigen::MatrixXd Xtr = take_rows(tbl.values, sp.train);
    const Eigen::MatrixXd Xte = take_rows(tbl.values, sp.test);
    const std::vector<int> ytr = take(y, sp.train);
    const std::vector<int> yte = take(y, sp.test);

    FeatureScaler sc;
    sc.fit(Xtr);
    std::unique_ptr<IModel> model = make_model(model_type_);
    model->fit(sc.apply(Xtr), ytr, opt_);

    const std::vector<int> pred = threshold(model->predict_proba(sc.apply(Xte)));
    rep.accuracy  = accuracy(yte, pred);
    rep.confusion = confusion_matrix(yte, pred);
    rep.per_class = class_report(rep.confusion);
    rep.feature_importance = rank_importance(tbl.columns, model->feature_importance());

    /* ---------- k-fold CV on the train side ---------- */
    const int k = std::min(opt_.cv_folds, minority_count(ytr));
    if (k >= 2) {
        const std::vector<int> fold = stratified_folds(ytr, k, opt_.seed);
        std::vector<double> scores;
        for (int f = 0; f < k; ++f) {
            std::vector<int> in, out;
            for (std::size_t i = 0; i < fold.size(); ++i)
                (fold[i] == f ? out : in).push_back(static_cast<int>(i));
            const std::vector<int> yin = take(ytr, in);
            if (minority_count(yin) == 0) continue;

            FeatureScaler fs;
            const Eigen::MatrixXd Xin = take_rows(Xtr, in);
            fs.fit(Xin);
            auto fm = make_model(model_type_);
            fm->fit(fs.apply(Xin), yin, opt_);
            scores.push_back(accuracy(take(ytr, out),
                                      threshold(fm->predict_proba(fs.apply(take_rows(Xtr, out))))));
        }
        if (!scores.empty()) {
            const double n = static_cast<double>(scores.size());
            rep.cv_mean = std::accumulate(scores.begin(), scores.end(), 0.0) / n;
            double var = 0.0;
            for (double s : scores) var += (s - rep.cv_mean) * (s - rep.cv_mean);
            rep.cv_std   = std::sqrt(var / n);
            rep.cv_folds = static_cast<int>(scores.size());
        }
    } else {
        logW("too few minority samples for cross validation; skipped");
    }

    /* ---------- commit ---------- */
    builder_         = std::move(nb);
    scaler_          = std::move(sc);
    model_           = std::move(model);
    importance_cols_ = tbl.columns;
    trained_at_      = now_iso8601();

    logI(model_type_ + " trained on " + std::to_string(rep.training_size) +
         " trains, test acc=" + fmt_fixed(rep.accuracy, 3) +
         " cv=" + fmt_fixed(rep.cv_mean, 3) + "±" + fmt_fixed(rep.cv_std, 3));
    return rep;
}

std::vector<PredictionResult> Predictor::predict(const std::vector<TrainRecord>& data) const
{
    if (data.empty()) {
        if (is_trained()) throw InputError("empty fleet passed to a trained predictor");
        return {};
    }
    validate_identifiers(data);

    std::vector<double> prob;
    if (!is_trained()) {
        for (const auto& t : resolve_all(data)) prob.push_back(rule_probability(t));
    } else {
        const FeatureTable tbl = builder_.transform(data);
        prob = model_->predict_proba(scaler_.apply(tbl.values));
    }

    std::vector<PredictionResult> out;
    out.reserve(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        PredictionResult r;
        r.train_id        = data[i].train_id;
        r.probability     = prob[i];
        r.predicted_label = prob[i] > 0.5 ? 1 : 0;
        r.confidence      = std::fabs(prob[i] - 0.5) * 2.0;
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<std::pair<std::string, double>> Predictor::feature_importance() const
{
    if (!is_trained()) return {};
    return rank_importance(importance_cols_, model_->feature_importance());
}

/* ─────────────────── persistence ─────────────────── */
std::string Predictor::persist() const
{
    if (!is_trained()) throw InputError("cannot persist an untrained predictor");
    nlohmann::json j;
    j["format"]          = kFormatTag;
    j["version"]         = kFormatVersion;
    j["model_type"]      = model_type_;
    j["trained_at"]      = trained_at_;
    j["feature_columns"] = builder_.feature_columns();
    j["scaler"]          = scaler_.to_json();
    j["encoders"]        = builder_.encoders_to_json();
    j["model"]           = model_->to_json();
    return j.dump();
}

void Predictor::restore(const std::string& blob)
{
    try {
        const nlohmann::json j = nlohmann::json::parse(blob);
        if (j.at("format").get<std::string>() != kFormatTag)
            throw ModelLoadError("not an induction model artifact");
        if (j.at("version").get<int>() != kFormatVersion)
            throw ModelLoadError("unsupported artifact version");

        const std::string type = j.at("model_type").get<std::string>();
        if (!is_known_model_type(type)) throw ModelLoadError("unknown model type '" + type + "'");

        auto cols = j.at("feature_columns").get<std::vector<std::string>>();
        if (cols.empty()) throw ModelLoadError("artifact has no feature columns");
        FeatureScaler sc = FeatureScaler::from_json(j.at("scaler"));
        if (static_cast<std::size_t>(sc.dims()) != cols.size())
            throw ModelLoadError("scaler does not match the feature columns");

        FeatureBuilder nb(fopt_);
        nb.encoders_from_json(j.at("encoders"));
        nb.set_feature_columns(cols);

        std::unique_ptr<IModel> m = make_model(type);
        m->from_json(j.at("model"));
        if (static_cast<std::size_t>(m->n_features()) != cols.size())
            throw ModelLoadError("model expects " + std::to_string(m->n_features()) +
                                 " features, artifact lists " + std::to_string(cols.size()));

        model_type_      = type;
        builder_         = std::move(nb);
        scaler_          = std::move(sc);
        model_           = std::move(m);
        importance_cols_ = std::move(cols);
        trained_at_      = j.value("trained_at", std::string{});
    } catch (const ModelLoadError&) {
        reset();
        throw;
    } catch (const nlohmann::json::exception& e) {
        reset();
        throw ModelLoadError(e.what());
    } catch (const Error& e) {
        reset();
        throw ModelLoadError(e.what());
    }
}

void Predictor::save_model(const std::string& path) const
{
    write_file_atomic(path, persist());
    logI("model saved to " + path);
}

bool Predictor::load_model(const std::string& path)
{
    if (!file_exists(path)) {
        logI("no model at " + path + "; predictor stays untrained");
        return false;
    }
    try {
        restore(read_file(path));
    } catch (const Error& e) {
        logE(std::string("failed to load ") + path + ": " + e.what());
        reset();
        return false;
    }
    logI("loaded " + model_type_ + " model from " + path);
    return true;
}

} // namespace induct
