#pragma once

#include "healthd/v1/event.pb.h"
