#include "Composer.h"
#include "Logging.h"
#include "Utils.h"
#include "JsonUtil.h"

namespace revkit {

long long Composer::estimate_tokens(const std::string& text) {
    return static_cast<long long>((text.size() + kBytesPerToken - 1) / kBytesPerToken);
}

Composition Composer::compose(const ExecutionPlan& plan) const {
    Composition out;
    auto& man = out.manifest;
    man.declared_tokens = plan.total_tokens;
    for(const auto* m : plan.ordered_modules) {
        std::string blob = loader_.load(m->id);
        ComposedEntry e;
        e.id = m->id;
        e.declared_tokens = m->token_estimate;
        e.measured_tokens = estimate_tokens(blob);
        e.offset = out.artifact.size();
        e.length = blob.size();
        Logger::instance().trace("composed " + m->id + " (" + std::to_string(e.length) + " bytes) from " + loader_.name());
        out.artifact += blob;
        man.measured_tokens += e.measured_tokens;
        man.entries.push_back(std::move(e));
    }
    man.artifact_bytes = out.artifact.size();
    man.sha256 = utils::sha256_hex(out.artifact);

    double limit = static_cast<double>(man.declared_tokens) * (1.0 + kTokenTolerance);
    if(static_cast<double>(man.measured_tokens) > limit) {
        double pct = man.declared_tokens > 0
            ? (static_cast<double>(man.measured_tokens) / static_cast<double>(man.declared_tokens) - 1.0) * 100.0
            : 100.0;
        std::string msg = "measured size " + std::to_string(man.measured_tokens) + " tokens exceeds declared " +
                          std::to_string(man.declared_tokens) + " by " + jsonutil::format_decimal(pct, 1) + "%";
        Logger::instance().warn(msg);
        man.warnings.push_back(msg);
    }
    return out;
}

}
