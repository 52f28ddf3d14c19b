#include "io/Snapshot.h"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

void writeNumber(std::ostream& os, double v) {
    if (std::isfinite(v)) {
        os << v;
    } else {
        os << "null";
    }
}

void writeArray(std::ostream& os, const std::vector<double>& values) {
    os << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        writeNumber(os, values[i]);
        if (i + 1 < values.size()) os << ",";
    }
    os << "]";
}

constexpr int kReportPrecision = std::numeric_limits<double>::max_digits10;

}  // namespace

std::string formatParam(double value) {
    std::ostringstream os;
    os << std::setprecision(12) << value;
    std::string s = os.str();
    if (s.find_first_of(".en") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string reportToJson(const OpinionModel& model, bool includeAgents) {
    const auto& cfg = model.config();
    const auto& obs = model.observations();
    std::ostringstream os;
    os << std::setprecision(kReportPrecision);

    os << "{";
    os << "\"params\":{";
    os << "\"n_agents\":" << cfg.nAgents << ",";
    os << "\"social_id_groups\":[" << cfg.socialIdGroups[0] << "," << cfg.socialIdGroups[1] << "],";
    os << "\"k\":" << cfg.k << ",";
    os << "\"k_in\":" << cfg.kIn << ",";
    os << "\"k_out\":" << cfg.kOut << ",";
    os << "\"p_rewire\":" << cfg.pRewire << ",";
    os << "\"sig_op_0\":" << cfg.sigOp0 << ",";
    os << "\"communication_frequency\":" << cfg.communicationFrequency << ",";
    os << "\"kappa\":" << cfg.kappa << ",";
    os << "\"delta_0\":" << cfg.delta0 << ",";
    os << "\"n_beliefs\":" << cfg.nBeliefs << ",";
    os << "\"consensus_rule\":\""
       << (cfg.consensusRule == ConsensusRule::Cumulative ? "cumulative" : "consecutive") << "\",";
    os << "\"sigma_threshold_consensus\":" << model.sigmaThresholdConsensus();
    os << "},";

    os << "\"seed\":" << cfg.seed << ",";
    os << "\"ain\":" << cfg.alphaIn << ",";
    os << "\"aout\":" << cfg.alphaOut << ",";

    os << "\"time\":[";
    for (std::size_t i = 0; i < obs.size(); ++i) {
        os << obs[i].time;
        if (i + 1 < obs.size()) os << ",";
    }
    os << "],";

    std::vector<double> avg, sd;
    avg.reserve(obs.size());
    sd.reserve(obs.size());
    for (const auto& o : obs) {
        avg.push_back(o.avgMeanOpinion);
        sd.push_back(o.stdMeanOpinion);
    }
    os << "\"avg_mean_ops\":";
    writeArray(os, avg);
    os << ",\"std_mean_ops\":";
    writeArray(os, sd);

    os << ",\"consensus_time\":";
    if (model.consensusReached()) {
        os << model.consensusTime();
    } else {
        os << "null";
    }
    os << ",\"consensus_mean\":";
    writeNumber(os, model.consensusMean());

    if (includeAgents && cfg.agentReporter) {
        os << ",\"mean_op\":[";
        for (std::size_t i = 0; i < obs.size(); ++i) {
            writeArray(os, obs[i].agentMeans);
            if (i + 1 < obs.size()) os << ",";
        }
        os << "],\"sig\":[";
        for (std::size_t i = 0; i < obs.size(); ++i) {
            writeArray(os, obs[i].agentSigmas);
            if (i + 1 < obs.size()) os << ",";
        }
        os << "]";
    }
    os << "}";

    return os.str();
}

void writeCheckpointCsv(const OpinionModel& model, std::ostream& out) {
    out << "time,avg_mean_op,std_mean_op\n";
    out << std::setprecision(kReportPrecision);
    for (const auto& o : model.observations()) {
        out << o.time << "," << o.avgMeanOpinion << "," << o.stdMeanOpinion << "\n";
    }
}

void writeAgentCsv(const OpinionModel& model, std::ostream& out) {
    if (!model.config().agentReporter) {
        throw std::logic_error("writeAgentCsv: run was made without agent reporter");
    }
    const auto& agents = model.agents();
    out << "time,agent_id,group,mean_op,sig\n";
    out << std::setprecision(kReportPrecision);
    for (const auto& o : model.observations()) {
        for (std::size_t i = 0; i < o.agentMeans.size(); ++i) {
            out << o.time << "," << i << "," << agents[i].socialIdentity << ","
                << o.agentMeans[i] << "," << o.agentSigmas[i] << "\n";
        }
    }
}

void writeProvenance(const ModelConfig& cfg, std::ostream& out) {
    out << std::setprecision(kReportPrecision);
    out << "# n_agents=" << cfg.nAgents << "\n"
        << "# social_id_groups=" << cfg.socialIdGroups[0] << ";" << cfg.socialIdGroups[1] << "\n"
        << "# k=" << cfg.k << "\n"
        << "# k_in=" << cfg.kIn << "\n"
        << "# k_out=" << cfg.kOut << "\n"
        << "# p_rewire=" << cfg.pRewire << "\n"
        << "# sig_op_0=" << cfg.sigOp0 << "\n"
        << "# communication_frequency=" << cfg.communicationFrequency << "\n"
        << "# kappa=" << cfg.kappa << "\n"
        << "# delta_0=" << cfg.delta0 << "\n"
        << "# sigma_threshold_consensus=" << ConsensusConstants::kSigmaThreshold << "\n";
}

std::string runFileStem(const ModelConfig& cfg) {
    std::ostringstream os;
    os << "ms1_WS" << formatParam(cfg.pRewire)
       << "_n" << cfg.nAgents
       << "_k-" << cfg.k
       << "_kin-" << cfg.kIn
       << "_kout-" << cfg.kOut
       << "_sig-" << formatParam(cfg.sigOp0)
       << "_commf-" << formatParam(cfg.communicationFrequency)
       << "_kappa-" << formatParam(cfg.kappa)
       << "_delta-" << formatParam(cfg.delta0);
    return os.str();
}
