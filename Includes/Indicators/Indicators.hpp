#pragma once

// 지표들의 헤더 모음
#include "Indicators/ExtremumScanner.hpp"
#include "Indicators/OutputDensifier.hpp"
#include "Indicators/SwingReducer.hpp"
#include "Indicators/ZigZag.hpp"
