//
// Created by gregorian-rayne on 10/16/26.
//

#ifndef CRASHTESTAUDIT_CTA_HPP
#define CRASHTESTAUDIT_CTA_HPP

/**
 * @file cta.hpp
 * @brief Main header for the Crash Test Audit library.
 *
 * Pulls in the core types and every pipeline stage: history scan, current
 * file listing, open issue snapshot, correlation and reporting. Include
 * specific headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"

#include "config/config.hpp"
#include "extract/metadata_extractor.hpp"
#include "git/git_integration.hpp"
#include "git/deletion_scanner.hpp"
#include "git/current_files.hpp"
#include "tracker/snapshot.hpp"
#include "tracker/issue_tracker.hpp"
#include "tracker/snapshot_cache.hpp"
#include "tracker/snapshot_provider.hpp"
#include "analysis/correlation_engine.hpp"
#include "report/report_renderer.hpp"
#include "utils/time_utils.hpp"

#endif //CRASHTESTAUDIT_CTA_HPP
