#include "codec/verb.hpp"

namespace vgauge {

Verb resolve_verb_a(char verb)
{
    switch (verb) {
        case 'T': return Verb::TYPE;
        case 'M': return Verb::READ_PRESSURE;
        case 'm': return Verb::WRITE_PRESSURE;
        case 'S': return Verb::READ_SETPOINT;
        case 's': return Verb::WRITE_SETPOINT;
        case 'C': return Verb::READ_CALIBRATION;
        case 'c': return Verb::WRITE_CALIBRATION;
        case 'I': return Verb::READ_PENNING_STATE;
        case 'i': return Verb::WRITE_PENNING_STATE;
        case 'W': return Verb::READ_PENNING_SYNC;
        case 'w': return Verb::WRITE_PENNING_SYNC;
        case 'j': return Verb::ADJUST;
        default: return Verb::UNKNOWN;
    }
}

char verb_char(Verb verb)
{
    switch (verb) {
        case Verb::TYPE: return 'T';
        case Verb::READ_PRESSURE: return 'M';
        case Verb::WRITE_PRESSURE: return 'm';
        case Verb::READ_SETPOINT: return 'S';
        case Verb::WRITE_SETPOINT: return 's';
        case Verb::READ_CALIBRATION: return 'C';
        case Verb::WRITE_CALIBRATION: return 'c';
        case Verb::READ_PENNING_STATE: return 'I';
        case Verb::WRITE_PENNING_STATE: return 'i';
        case Verb::READ_PENNING_SYNC: return 'W';
        case Verb::WRITE_PENNING_SYNC: return 'w';
        case Verb::ADJUST: return 'j';
        case Verb::UNKNOWN: break;
    }
    return '\0';
}

const char* verb_name(Verb verb)
{
    switch (verb) {
        case Verb::TYPE: return "TYPE";
        case Verb::READ_PRESSURE: return "READ_PRESSURE";
        case Verb::WRITE_PRESSURE: return "WRITE_PRESSURE";
        case Verb::READ_SETPOINT: return "READ_SETPOINT";
        case Verb::WRITE_SETPOINT: return "WRITE_SETPOINT";
        case Verb::READ_CALIBRATION: return "READ_CALIBRATION";
        case Verb::WRITE_CALIBRATION: return "WRITE_CALIBRATION";
        case Verb::READ_PENNING_STATE: return "READ_PENNING_STATE";
        case Verb::WRITE_PENNING_STATE: return "WRITE_PENNING_STATE";
        case Verb::READ_PENNING_SYNC: return "READ_PENNING_SYNC";
        case Verb::WRITE_PENNING_SYNC: return "WRITE_PENNING_SYNC";
        case Verb::ADJUST: return "ADJUST";
        case Verb::UNKNOWN: break;
    }
    return "UNKNOWN";
}

} // namespace vgauge
