#ifndef CLEANUPSUPERVISOR_H
#define CLEANUPSUPERVISOR_H

#include "transfersession.h"

// Limpieza tras una salida anómala: solo borra lo que creó la propia sesión
class CleanupSupervisor
{
public:
    enum Outcome {
        NotRequired,   // La sesión no terminó en Failed ni Cancelled
        Preserved,     // El destino ya existía: no se toca
        Removed,
        RemovalFailed  // Se registra, no se propaga
    };

    Outcome onAbnormalExit(const TransferSession &session) const;
};

#endif // CLEANUPSUPERVISOR_H
