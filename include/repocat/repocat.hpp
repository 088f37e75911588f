#pragma once

/**
 * repocat - repository file catalogue
 *
 * Lists every file in a source tree with a detected language and a
 * one-line summary derived from its name and path alone.
 */

#include <repocat/types.hpp>
#include <repocat/result.hpp>
#include <repocat/config.hpp>
#include <repocat/language_detector.hpp>
#include <repocat/summary_classifier.hpp>
#include <repocat/file_scanner.hpp>
#include <repocat/report_generator.hpp>
