#include <model_loaders/sample_model.hpp>
#include <initializer_list>
#include <utility>

namespace model_loaders {

model_source::MemoryRepository generate_sample_repository() {
    model_source::MemoryRepository repo;

    auto package = [&](int id, int parent_id, const char* name) {
        model_source::SourcePackage p;
        p.id = id;
        p.parent_id = parent_id;
        p.name = name;
        repo.add_package(std::move(p));
    };
    auto attr = [](int id, const char* name, const char* type, const char* def) {
        return model_source::SourceAttribute{ id, name, type, def };
    };
    auto place = [](int element_id, int left, int top, int width, int height) {
        model_source::DiagramObject o;
        o.element_id = element_id;
        o.left = left;
        o.right = left + width;
        o.top = -top;
        o.bottom = -(top + height);
        return o;
    };
    auto diagram = [&](int id, int package_id, int parent_element_id, const char* name,
                       std::initializer_list<model_source::DiagramObject> objects) {
        model_source::SourceDiagram d;
        d.id = id;
        d.package_id = package_id;
        d.parent_element_id = parent_element_id;
        d.name = name;
        d.objects.assign(objects.begin(), objects.end());
        repo.add_diagram(std::move(d));
    };
    auto element = [&](int id, int package_id, int classifier_id, const char* name, const char* type,
                       std::initializer_list<model_source::SourceAttribute> attributes) {
        model_source::SourceElement e;
        e.id = id;
        e.package_id = package_id;
        e.classifier_id = classifier_id;
        e.name = name;
        e.type = type;
        e.attributes.assign(attributes.begin(), attributes.end());
        repo.add_element(std::move(e));
    };
    auto connector = [&](int id, int client_id, int supplier_id, const char* type, const char* name) {
        repo.add_connector(model_source::SourceConnector{ id, client_id, supplier_id, type, name });
    };

    package(1, 0, "Sales Model");
    package(2, 1, "Ordering");
    package(3, 1, "Shared Types");
    package(4, 2, "Fulfilment");

    element(10, 2, 20, "Customer", "Class",
        { attr(1, "customerId", "int", "0"), attr(2, "name", "string", ""), attr(3, "status", "CustomerStatus", "Active") });
    element(11, 2, 0, "Order", "Class",
        { attr(4, "orderId", "int", "0"), attr(5, "total", "decimal", "0.0") });
    element(12, 2, 0, "OrderLine", "Class",
        { attr(6, "quantity", "int", "1"), attr(7, "unitPrice", "decimal", "0.0") });
    element(13, 4, 0, "Shipment", "Class",
        { attr(8, "trackingCode", "string", "") });
    element(20, 3, 0, "CustomerStatus", "Enumeration",
        { attr(9, "Active", "", ""), attr(10, "Suspended", "", ""), attr(11, "Closed", "", "") });

    // 999 has no element behind it.
    diagram(100, 2, 0, "Ordering Overview",
        { place(10, 40, 40, 160, 90), place(11, 280, 40, 160, 90), place(999, 520, 40, 120, 60) });
    diagram(101, 2, 11, "Order Details",
        { place(11, 40, 40, 160, 90), place(12, 280, 40, 160, 90), place(10, 40, 200, 160, 90) });
    diagram(102, 4, 0, "Fulfilment Overview",
        { place(13, 40, 40, 160, 90), place(11, 280, 40, 160, 90) });

    connector(1000, 10, 11, "Association", "places");
    connector(1001, 11, 12, "Aggregation", "contains");
    connector(1002, 10, 11, "Association", "owns");
    connector(1003, 13, 11, "Dependency", "ships");

    return repo;
}

} // namespace model_loaders
