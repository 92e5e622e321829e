#pragma once

/**
 * @brief detects duplicate files, exact digest for generic files and
 * perceptual hash for images, quarantines the redundant copies and sorts
 * images into date folders. Symlinks are not followed, empty and unreadable
 * files are ignored.
 *
 *   scan(dir)                     -> image and generic duplicate classes
 *   resolve_dupes(classes, keep)  -> moved count, bytes, files, folder
 *   classify(dir, bucket)         -> total, organized, skipped images
 *   run(opts, cancel)             -> one job end to end
 */

#include "audit_log.hh"
#include "classify.hh"
#include "config.hh"
#include "group_dupes.hh"
#include "keep.hh"
#include "log.hh"
#include "resolve.hh"
#include "run.hh"
#include "scan.hh"
