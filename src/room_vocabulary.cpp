#include "entity_resolver.h"

namespace domo_nlu {

// Canonical names first, so a name that is also another room's alias resolves to itself.
const std::vector<RoomDefinition>& builtin_rooms() {
    static const std::vector<RoomDefinition> rooms = {
        {"sala", {"living", "salon", "sala de estar", "estancia", "living room", "lounge",
                  "recibidor", "sala principal", "living principal"}},
        {"cocina", {"kitchen", "cocineta", "kitchenette", "area de cocina", "zona de cocina"}},
        {"comedor", {"dining", "dining room", "area de comedor", "zona de comedor", "antecomedor"}},
        {"dormitorio", {"habitacion", "cuarto", "recamara", "bedroom", "alcoba", "pieza",
                        "cuarto de dormir", "aposento"}},
        {"dormitorio_principal", {"habitacion principal", "cuarto principal", "recamara principal",
                                  "master bedroom", "dormitorio master", "suite principal",
                                  "cuarto matrimonial"}},
        {"dormitorio_ninos", {"habitacion de niños", "cuarto de niños", "cuarto de los niños",
                              "habitacion infantil", "kids room", "cuarto de los chicos"}},
        {"dormitorio_invitados", {"habitacion de invitados", "cuarto de invitados", "guest room",
                                  "cuarto de huespedes", "habitacion de huespedes"}},
        {"bano", {"baño", "bathroom", "sanitario", "aseo", "toilet", "wc", "lavabo", "medio baño"}},
        {"bano_principal", {"baño principal", "baño master", "master bathroom", "baño en suite"}},
        {"oficina", {"office", "despacho", "estudio", "home office", "cuarto de trabajo", "area de trabajo"}},
        {"biblioteca", {"library", "sala de lectura", "cuarto de lectura"}},
        {"garage", {"garaje", "cochera", "parking", "estacionamiento"}},
        {"jardin", {"garden", "balcon", "area exterior", "exterior", "afuera", "quincho"}},
        {"terraza", {"terrace", "azotea", "rooftop", "mirador", "terraza techada"}},
        {"patio", {"patio trasero", "backyard", "traspatio", "patio delantero", "front yard"}},
        {"lavanderia", {"laundry", "cuarto de lavado", "area de lavado", "zona de lavado", "lavadero"}},
        {"bodega", {"almacen", "storage", "despensa", "cuarto de almacenamiento", "trastero"}},
        {"gym", {"gimnasio", "sala de ejercicios", "cuarto de ejercicio", "home gym"}},
        {"cine", {"sala de cine", "home theater", "home cinema", "cuarto de tv", "sala de tv", "media room"}},
        {"pasillo", {"corredor", "hallway", "hall", "vestibulo", "foyer"}},
        {"escalera", {"escaleras", "stairs", "stairway", "escalera principal"}},
        {"planta_baja", {"primer piso", "piso 1", "ground floor", "planta baja", "nivel 1"}},
        {"segundo_piso", {"piso 2", "planta alta", "second floor", "arriba", "nivel 2", "piso de arriba"}},
        {"sotano", {"basement", "subsuelo", "bajo tierra"}},
    };
    return rooms;
}

} // namespace domo_nlu
