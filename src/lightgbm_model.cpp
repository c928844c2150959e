/*  lightgbm_model.cpp  ---------------------------------------
 *  IModel on top of the LightGBM C API.
 *    booster "rf"   → bagged random forest (default model type)
 *    booster "gbdt" → gradient boosting
 *  The fitted booster is kept in memory and serialized as
 *  LightGBM's own text model inside our JSON artifact.
 * ----------------------------------------------------------- */
#include <LightGBM/c_api.h>

#include <algorithm>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

#include "induct/common.hpp"
#include "induct/errors.hpp"
#include "induct/model_iface.hpp"

namespace induct {

/* rc != 0 ⇒ InputError carrying LightGBM's last message */
static void chk(int rc, const char* what)
{
    if (rc != 0) throw InputError(std::string(what) + ": " + LGBM_GetLastError());
}

using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

class LGBModel : public IModel {
    std::string   booster_;             // "rf" or "gbdt"
    BoosterHandle handle_     = nullptr;
    int           n_features_ = 0;
    std::string   model_str_;

    void free_handle()
    {
        if (handle_) LGBM_BoosterFree(handle_);
        handle_ = nullptr;
    }

    std::string params(const TrainOpt& opt) const
    {
        const int leaves = std::max(2, std::min(1 << std::min(opt.max_depth, 16), 131072));
        std::string p = "boosting=" + booster_
              + " objective=binary"
              + " num_iterations=" + std::to_string(std::max(1, opt.trees))
              + " max_depth=" + std::to_string(opt.max_depth)
              + " num_leaves=" + std::to_string(std::min(leaves, 1024))
              + " min_data_in_leaf=" + std::to_string(std::max(1, opt.min_samples_leaf))
              + " min_sum_hessian_in_leaf=1e-3"
              + " min_data_in_bin=1"
              + " feature_fraction=" + std::to_string(opt.colsample)
              + " seed=" + std::to_string(opt.seed)
              + " deterministic=true force_row_wise=true"
              + " num_threads=" + std::to_string(std::max(1, opt.threads))
              + " verbosity=-1";

        if (booster_ == "rf") {
            /* rf needs bagging: fraction < 1 and freq > 0 */
            const double frac = (opt.subsample > 0.0 && opt.subsample < 1.0) ? opt.subsample : 0.8;
            p += " bagging_fraction=" + std::to_string(frac) + " bagging_freq=1";
        } else {
            p += " learning_rate=" + std::to_string(opt.lr);
        }
        return p;
    }

    void load_from_string(const std::string& s)
    {
        BoosterHandle h = nullptr;
        int iters = 0;
        chk(LGBM_BoosterLoadModelFromString(s.c_str(), &iters, &h), "BoosterLoadModelFromString");
        int nf = 0;
        if (LGBM_BoosterGetNumFeature(h, &nf) != 0) {
            LGBM_BoosterFree(h);
            throw Error(std::string("BoosterGetNumFeature: ") + LGBM_GetLastError());
        }
        free_handle();
        handle_     = h;
        n_features_ = nf;
        model_str_  = s;
    }

public:
    explicit LGBModel(std::string booster) : booster_(std::move(booster)) {}
    ~LGBModel() override { free_handle(); }

    LGBModel(const LGBModel&)            = delete;
    LGBModel& operator=(const LGBModel&) = delete;

    void fit(const Eigen::MatrixXd& X, const std::vector<int>& y,
             const TrainOpt& opt) override
    {
        const int N = static_cast<int>(X.rows());
        const int F = static_cast<int>(X.cols());
        if (N == 0 || static_cast<std::size_t>(N) != y.size())
            throw InputError("lightgbm: X/y size mismatch");

        const RowMajorMatrix rm = X;
        std::vector<float> label(y.begin(), y.end());
        const std::string param = params(opt);

        DatasetHandle dtrain = nullptr;
        chk(LGBM_DatasetCreateFromMat(rm.data(), C_API_DTYPE_FLOAT64, N, F, 1,
                                      param.c_str(), nullptr, &dtrain),
            "DatasetCreateFromMat");
        std::unique_ptr<void, int (*)(DatasetHandle)> ds_guard(dtrain, LGBM_DatasetFree);
        chk(LGBM_DatasetSetField(dtrain, "label", label.data(), N, C_API_DTYPE_FLOAT32),
            "DatasetSetField(label)");

        BoosterHandle booster = nullptr;
        chk(LGBM_BoosterCreate(dtrain, param.c_str(), &booster), "BoosterCreate");
        std::unique_ptr<void, int (*)(BoosterHandle)> bo_guard(booster, LGBM_BoosterFree);

        for (int it = 0; it < std::max(1, opt.trees); ++it) {
            int finished = 0;
            chk(LGBM_BoosterUpdateOneIter(booster, &finished), "BoosterUpdateOneIter");
            if (finished) break;
        }

        /* ---- keep the text model; it is what we persist ---- */
        int64_t len = 0;
        chk(LGBM_BoosterSaveModelToString(booster, 0, -1, C_API_FEATURE_IMPORTANCE_GAIN,
                                          0, &len, nullptr),
            "BoosterSaveModelToString(size)");
        std::string buf(static_cast<std::size_t>(len), '\0');
        chk(LGBM_BoosterSaveModelToString(booster, 0, -1, C_API_FEATURE_IMPORTANCE_GAIN,
                                          len, &len, &buf[0]),
            "BoosterSaveModelToString");
        if (!buf.empty() && buf.back() == '\0') buf.pop_back();

        free_handle();
        handle_     = bo_guard.release();
        n_features_ = F;
        model_str_  = std::move(buf);
    }

    std::vector<double> predict_proba(const Eigen::MatrixXd& X) const override
    {
        if (!handle_) throw Error("lightgbm: model not fitted");
        if (X.cols() != n_features_)
            throw InputError("lightgbm expects " + std::to_string(n_features_) + " features");

        const RowMajorMatrix rm = X;
        std::vector<double> out(static_cast<std::size_t>(X.rows()));
        if (out.empty()) return out;
        int64_t out_len = 0;
        chk(LGBM_BoosterPredictForMat(handle_, rm.data(), C_API_DTYPE_FLOAT64,
                                      static_cast<int32_t>(X.rows()), n_features_, 1,
                                      C_API_PREDICT_NORMAL, 0, -1, "", &out_len, out.data()),
            "BoosterPredictForMat");
        for (double& p : out) p = clamp_val(p, 0.0, 1.0);
        return out;
    }

    std::vector<double> feature_importance() const override
    {
        std::vector<double> imp(static_cast<std::size_t>(n_features_), 0.0);
        if (!handle_) return imp;
        chk(LGBM_BoosterFeatureImportance(handle_, 0, C_API_FEATURE_IMPORTANCE_GAIN, imp.data()),
            "BoosterFeatureImportance");
        const double s = std::accumulate(imp.begin(), imp.end(), 0.0);
        if (s > 0) for (double& v : imp) v /= s;
        return imp;
    }

    nlohmann::json to_json() const override
    {
        return {{"booster", booster_}, {"n_features", n_features_}, {"model", model_str_}};
    }

    void from_json(const nlohmann::json& j) override
    {
        const std::string b = j.at("booster").get<std::string>();
        if (b != booster_) throw ModelLoadError("lightgbm booster mismatch: " + b);
        const int nf = j.at("n_features").get<int>();
        try {
            load_from_string(j.at("model").get<std::string>());
        } catch (const Error& e) {
            throw ModelLoadError(e.what());
        }
        if (n_features_ != nf) {
            free_handle();
            throw ModelLoadError("lightgbm feature count mismatch");
        }
    }

    std::string type_name() const override { return booster_ == "rf" ? "random_forest" : "lightgbm"; }
    int n_features() const override { return n_features_; }
};

std::unique_ptr<IModel> make_lightgbm(const std::string& booster)
{
    if (booster != "rf" && booster != "gbdt")
        throw InputError("unsupported LightGBM booster '" + booster + "'");
    return std::make_unique<LGBModel>(booster);
}

} // namespace induct
