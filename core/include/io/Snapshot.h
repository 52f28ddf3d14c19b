#ifndef OPINION_SNAPSHOT_H
#define OPINION_SNAPSHOT_H

#include "kernel/OpinionModel.h"
#include <string>
#include <iosfwd>

// JSON report: parameters, checkpoint statistics, consensus, and optional agent data
std::string reportToJson(const OpinionModel& model, bool includeAgents = true);

// CSV: time,avg_mean_op,std_mean_op
void writeCheckpointCsv(const OpinionModel& model, std::ostream& out);

// CSV: time,agent_id,group,mean_op,sig (requires agentReporter)
void writeAgentCsv(const OpinionModel& model, std::ostream& out);

// "# key=value" lines echoing the run parameters, consensus threshold and group labels
void writeProvenance(const ModelConfig& cfg, std::ostream& out);

// File name stem shared by all runs of one parameter setting
std::string runFileStem(const ModelConfig& cfg);

// Shortest round-trip text for a double, always with a decimal point ("0.0", "0.25")
std::string formatParam(double value);

#endif
