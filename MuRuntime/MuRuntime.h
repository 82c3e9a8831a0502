#ifndef _MuRuntime_MuRuntime_h_
#define _MuRuntime_MuRuntime_h_

// Standard library includes
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <cstddef>
#include <cmath>
#include <ctime>
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <iomanip>
#include <thread>
#include <random>
#include <regex>
#include <chrono>
#include <limits>
#include <deque>
#include <cerrno>

// System includes
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>

#include "json.h"
#include "protocol.h"
#include "hardware.h"
#include "simulation.h"
#include "py_value.h"
#include "py_ast.h"
#include "interpreter.h"
#include "worker.h"
#include "subprocess.h"
#include "channel.h"
#include "passthrough.h"
#include "correlation.h"
#include "completion.h"
#include "cli_commands.h"
#include "session.h"
#include "config.h"
#include "terminal_ui.h"

#endif
