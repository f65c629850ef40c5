#ifndef SETTINGS_HPP
#define SETTINGS_HPP
#include <cstdint>

namespace Settings
{

//Driver settings - applied when the engine is constructed
extern uint32_t timeout_ms;
extern uint32_t reseed_interval;

//Simulated engine - STATUS/INT_STATUS polls before an operation completes
extern int latency_polls;

void load();
void save();

}

#endif // SETTINGS_HPP
