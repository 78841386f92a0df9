#pragma once
#include "AnalysisService.h"
#include <iostream>
#include <string>

class TerminalUI {
public:
    static void printRunHeader(const std::string& requestPath, const AnalysisRequest& request, const SieveScale& scale,
                               std::ostream& out = std::cout);
    static void printParameterTable(const AnalysisResponse& response, std::ostream& out = std::cout);
    static void printIssues(const AnalysisResponse& response, std::ostream& out = std::cout);
};
