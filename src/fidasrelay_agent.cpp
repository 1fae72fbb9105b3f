/**
 * @file fidasrelay_agent.cpp
 * @brief Relay binary: Fidas dust monitor exports -> CITIESair
 *
 * Run:
 *   CITIESAIR_API_KEY=... ./fidasrelay /etc/fidasrelay/fidasrelay.json
 */

#include <fidasrelay/agent_main.hpp>

FIDASRELAY_AGENT_MAIN()
