#include "IOutputEngine.h"

#include <QtGlobal>

double IOutputEngine::volumeToGain(int level)
{
    const double v = qBound(0, level, 100) / 100.0;
    return v * v;
}
