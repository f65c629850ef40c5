#include <QSettings>
#include "../core/se/config.hpp"
#include "settings.hpp"

uint32_t Settings::timeout_ms;
uint32_t Settings::reseed_interval;
int Settings::latency_polls;

namespace Settings
{

void load()
{
    QSettings qset("SecurityEngine", "sectl");
    SE_Config defaults;

    timeout_ms = qset.value("driver/timeout_ms", defaults.timeout_ms).toUInt();
    reseed_interval = qset.value("driver/reseed_interval", defaults.reseed_interval).toUInt();
    latency_polls = qset.value("sim/latency_polls", 0).toInt();
}

void save()
{
    QSettings qset("SecurityEngine", "sectl");

    qset.setValue("driver/timeout_ms", timeout_ms);
    qset.setValue("driver/reseed_interval", reseed_interval);
    qset.setValue("sim/latency_polls", latency_polls);
}

}
