#pragma once

// imuskel - Aggregate Header
// Include this for the calibration and retargeting pipeline

#include "imuskel/error.hpp"
#include "imuskel/log.hpp"
#include "imuskel/quaternion.hpp"
#include "imuskel/sample.hpp"
#include "imuskel/calibration.hpp"
#include "imuskel/corrector.hpp"
#include "imuskel/skeleton.hpp"
#include "imuskel/retargeter.hpp"
#include "imuskel/timer.hpp"
#include "imuskel/config.hpp"
#include "imuskel/session.hpp"
#include "imuskel/pose_export.hpp"
