#pragma once

/**
 * @file QiBlast.h
 * @brief Main header file for QiBlast library
 *
 * QiBlast infers the drilling structure of a blast-hole pattern: ordered rows,
 * positions within rows, straight / curved / multi-pattern geometry and
 * forward / serpentine numbering.
 *
 * @version 0.1.0
 */

// Core types and utilities
#include <QiBlast/Core/Types.h>
#include <QiBlast/Core/Constants.h>
#include <QiBlast/Core/Exception.h>
#include <QiBlast/Core/DetectionConfig.h>
#include <QiBlast/Core/PatternResult.h>

// Analysis
#include <QiBlast/Analysis/PointSetAnalyzer.h>
#include <QiBlast/Analysis/SerpentineAnalyzer.h>
#include <QiBlast/Classify/PatternClassifier.h>
#include <QiBlast/Classify/SubPatternSeparator.h>

// Detection
#include <QiBlast/Detect/RowStrategy.h>
#include <QiBlast/Detect/RowDetector.h>
#include <QiBlast/Validate/RowValidator.h>
#include <QiBlast/Edit/RowEditing.h>

namespace Qi::Blast {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return "0.1.0";
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = 0;
    minor = 1;
    patch = 0;
}

} // namespace Qi::Blast
